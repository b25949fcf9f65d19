/**
 * @file wire_engine.cpp
 * @brief WireEngine implementation.
 */

#include "engine/wire_engine.hpp"

#include "graph/cycle_guard.hpp"
#include "graph/dependency_graph.hpp"
#include "graph/readiness.hpp"
#include "store/edge_store.hpp"
#include "store/schema.hpp"
#include "store/task_store.hpp"

#include <chrono>
#include <utility>

namespace wires {

namespace {

Error not_found(const WireId& id) {
    return Error{ErrorCode::TaskNotFound, "Wire not found: " + id};
}

std::string join_path(const std::vector<WireId>& path) {
    std::string joined;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) joined += " -> ";
        joined += path[i];
    }
    return joined;
}

}  // namespace

Timestamp system_clock_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<std::unique_ptr<WireEngine>> WireEngine::open(const RepositoryHandle& handle,
                                                     const Config& config,
                                                     Logger& logger,
                                                     std::unique_ptr<IdGenerator> ids,
                                                     Clock clock) {
    auto db = SqliteDb::open(handle.db_path, config.store, SqliteDb::OpenMode::OpenExisting);
    if (!db) {
        logger.error("Cannot open " + handle.db_path.string() + ": " + db.error().message);
        return db.error();
    }
    if (auto verified = verify_schema(**db); !verified) {
        logger.error(verified.error().message);
        return verified.error();
    }

    if (!ids) ids = std::make_unique<HashIdGenerator>();
    if (!clock) clock = system_clock_now;

    logger.debug("Opened " + handle.db_path.string());
    return std::unique_ptr<WireEngine>(new WireEngine(handle, config, logger, std::move(*db),
                                                      std::move(ids), std::move(clock)));
}

WireEngine::WireEngine(RepositoryHandle handle, const Config& config, Logger& logger,
                       std::unique_ptr<SqliteDb> db, std::unique_ptr<IdGenerator> ids,
                       Clock clock)
    : handle_(std::move(handle))
    , max_id_attempts_(config.ids.max_attempts)
    , logger_(logger)
    , db_(std::move(db))
    , ids_(std::move(ids))
    , clock_(std::move(clock)) {}

// ─────────────────────────────────────────────
// Wires
// ─────────────────────────────────────────────

Result<Wire> WireEngine::create(const std::string& title,
                                std::optional<std::string> description,
                                Priority priority) {
    if (title.empty()) {
        return Error{ErrorCode::InvalidArgument, "Title must not be empty"};
    }

    auto tx = Transaction::begin(*db_, TransactionMode::Write);
    if (!tx) return tx.error();
    TaskStore tasks{*tx};

    Wire wire;
    wire.title = title;
    if (description && !description->empty()) {
        wire.description = std::move(description);
    }
    wire.status = Status::Todo;
    wire.priority = priority;
    wire.created_at = clock_();
    wire.updated_at = wire.created_at;

    bool assigned = false;
    for (uint32_t attempt = 0; attempt < max_id_attempts_; ++attempt) {
        WireId candidate = ids_->generate(title);
        auto taken = tasks.exists(candidate);
        if (!taken) return taken.error();
        if (!*taken) {
            wire.id = std::move(candidate);
            assigned = true;
            break;
        }
        logger_.debug("Id collision on " + candidate + ", regenerating");
    }
    if (!assigned) {
        logger_.error("No free id after " + std::to_string(max_id_attempts_) + " attempts");
        return Error{ErrorCode::IdSpaceExhausted,
                     "Could not allocate a unique wire id after "
                     + std::to_string(max_id_attempts_) + " attempts"};
    }

    if (auto inserted = tasks.insert(wire); !inserted) {
        logger_.error("Insert of " + wire.id + " failed: " + inserted.error().message);
        return inserted.error();
    }
    if (auto committed = tx->commit(); !committed) return committed.error();

    logger_.info("Created " + wire.id + " \"" + wire.title + "\"");
    return wire;
}

Result<WireWithDeps> WireEngine::load_with_deps(Transaction& tx, const WireId& id) const {
    TaskStore tasks{tx};
    EdgeStore edges{tx};

    auto wire = tasks.find(id);
    if (!wire) return wire.error();
    if (!*wire) return not_found(id);

    auto depends_on = edges.dependencies_of(id);
    if (!depends_on) return depends_on.error();
    auto blocks = edges.blocks_of(id);
    if (!blocks) return blocks.error();

    return WireWithDeps{std::move(**wire), std::move(*depends_on), std::move(*blocks)};
}

Result<WireWithDeps> WireEngine::get(const WireId& id) {
    auto tx = Transaction::begin(*db_, TransactionMode::Read);
    if (!tx) return tx.error();

    auto detail = load_with_deps(*tx, id);
    if (!detail) return detail.error();
    if (auto committed = tx->commit(); !committed) return committed.error();
    return detail;
}

Result<std::vector<WireWithDeps>> WireEngine::list(std::optional<Status> status) {
    auto tx = Transaction::begin(*db_, TransactionMode::Read);
    if (!tx) return tx.error();
    TaskStore tasks{*tx};
    EdgeStore edges{*tx};

    auto wires = tasks.list(status);
    if (!wires) return wires.error();

    std::vector<WireWithDeps> result;
    result.reserve(wires->size());
    for (auto& wire : *wires) {
        auto depends_on = edges.dependencies_of(wire.id);
        if (!depends_on) return depends_on.error();
        auto blocks = edges.blocks_of(wire.id);
        if (!blocks) return blocks.error();
        result.push_back(WireWithDeps{std::move(wire), std::move(*depends_on), std::move(*blocks)});
    }

    if (auto committed = tx->commit(); !committed) return committed.error();
    return result;
}

Result<void> WireEngine::remove(const WireId& id) {
    auto tx = Transaction::begin(*db_, TransactionMode::Write);
    if (!tx) return tx.error();
    TaskStore tasks{*tx};
    EdgeStore edges{*tx};

    auto exists = tasks.exists(id);
    if (!exists) return exists.error();
    if (!*exists) return not_found(id);

    // The foreign keys cascade as well; deleting explicitly keeps the
    // result independent of PRAGMA foreign_keys.
    if (auto cleared = edges.remove_touching(id); !cleared) return cleared;
    auto removed = tasks.remove(id);
    if (!removed) return removed.error();

    if (auto committed = tx->commit(); !committed) return committed;
    logger_.info("Removed " + id);
    return {};
}

// ─────────────────────────────────────────────
// Transitions
// ─────────────────────────────────────────────

Result<TransitionOutcome> WireEngine::update(const WireId& id, const WireUpdate& update) {
    if (update.title && update.title->empty()) {
        return Error{ErrorCode::InvalidArgument, "Title must not be empty"};
    }

    auto tx = Transaction::begin(*db_, TransactionMode::Write);
    if (!tx) return tx.error();
    TaskStore tasks{*tx};
    EdgeStore edges{*tx};

    auto before = tasks.find(id);
    if (!before) return before.error();
    if (!*before) return not_found(id);

    std::vector<TransitionWarning> warnings;
    if (update.status) {
        auto dependencies = edges.dependencies_of(id);
        if (!dependencies) return dependencies.error();
        warnings = warnings_for(*update.status, *dependencies);

        if (!is_conventional_transition((*before)->status, *update.status)) {
            logger_.debug("Unconventional transition of " + id + ": "
                          + std::string{to_string((*before)->status)} + " -> "
                          + std::string{to_string(*update.status)});
        }
    }

    auto applied = tasks.update(id, update, clock_());
    if (!applied) return applied.error();
    if (!*applied) return not_found(id);

    auto after = tasks.find(id);
    if (!after) return after.error();
    if (!*after) return not_found(id);

    if (auto committed = tx->commit(); !committed) return committed.error();

    if (!update.empty()) {
        logger_.info("Updated " + id + " (status " + std::string{to_string((*after)->status)} + ")");
    }
    for (const auto& warning : warnings) {
        logger_.warn("Completed " + id + " while dependency " + warning.wire_id + " is "
                     + std::string{to_string(warning.status)});
    }
    return TransitionOutcome{std::move(**after), std::move(warnings)};
}

Result<TransitionOutcome> WireEngine::start(const WireId& id) {
    WireUpdate change;
    change.status = Status::InProgress;
    return update(id, change);
}

Result<TransitionOutcome> WireEngine::done(const WireId& id) {
    WireUpdate change;
    change.status = Status::Done;
    return update(id, change);
}

Result<TransitionOutcome> WireEngine::cancel(const WireId& id) {
    WireUpdate change;
    change.status = Status::Cancelled;
    return update(id, change);
}

// ─────────────────────────────────────────────
// Dependencies
// ─────────────────────────────────────────────

Result<bool> WireEngine::add_dependency(const WireId& wire_id, const WireId& depends_on) {
    auto tx = Transaction::begin(*db_, TransactionMode::Write);
    if (!tx) return tx.error();
    TaskStore tasks{*tx};
    EdgeStore edges{*tx};

    for (const auto* id : {&wire_id, &depends_on}) {
        auto exists = tasks.exists(*id);
        if (!exists) return exists.error();
        if (!*exists) return not_found(*id);
    }

    auto cycle = would_create_cycle(edges, wire_id, depends_on);
    if (!cycle) return cycle.error();
    if (*cycle) {
        auto message = "Circular dependency detected: " + join_path(**cycle);
        logger_.warn("Rejected " + wire_id + " -> " + depends_on + ": " + message);
        return Error{ErrorCode::CircularDependency, std::move(message), std::move(**cycle)};
    }

    auto inserted = edges.insert(wire_id, depends_on);
    if (!inserted) return inserted.error();
    if (auto committed = tx->commit(); !committed) return committed.error();

    if (*inserted) {
        logger_.info("Added dependency " + wire_id + " -> " + depends_on);
    } else {
        logger_.debug("Dependency " + wire_id + " -> " + depends_on + " already present");
    }
    return *inserted;
}

Result<bool> WireEngine::remove_dependency(const WireId& wire_id, const WireId& depends_on) {
    auto tx = Transaction::begin(*db_, TransactionMode::Write);
    if (!tx) return tx.error();
    EdgeStore edges{*tx};

    auto removed = edges.remove(wire_id, depends_on);
    if (!removed) return removed.error();
    if (auto committed = tx->commit(); !committed) return committed.error();

    if (*removed) {
        logger_.info("Removed dependency " + wire_id + " -> " + depends_on);
    }
    return *removed;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

Result<std::vector<Wire>> WireEngine::ready() {
    auto tx = Transaction::begin(*db_, TransactionMode::Read);
    if (!tx) return tx.error();
    TaskStore tasks{*tx};
    EdgeStore edges{*tx};

    auto wires = tasks.list();
    if (!wires) return wires.error();
    auto all_edges = edges.all();
    if (!all_edges) return all_edges.error();
    if (auto committed = tx->commit(); !committed) return committed.error();

    auto graph = DependencyGraph::from(*wires, *all_edges);
    return resolve_ready(graph);
}

Result<GraphSnapshot> WireEngine::graph() {
    auto tx = Transaction::begin(*db_, TransactionMode::Read);
    if (!tx) return tx.error();
    TaskStore tasks{*tx};
    EdgeStore edges{*tx};

    auto wires = tasks.list();
    if (!wires) return wires.error();
    auto all_edges = edges.all();
    if (!all_edges) return all_edges.error();
    if (auto committed = tx->commit(); !committed) return committed.error();

    return GraphSnapshot{std::move(*wires), std::move(*all_edges)};
}

}  // namespace wires
