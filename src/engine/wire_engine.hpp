/**
 * @file wire_engine.hpp
 * @brief Facade over the stores, cycle guard, readiness and status policy.
 *
 * Every public operation is one unit of work: it opens a transaction,
 * performs all checks and writes inside it, and commits only on success.
 * Mutations use write transactions (BEGIN IMMEDIATE), so the existence
 * checks, cycle scan and insert of add_dependency() are serialized against
 * every other writer on the same database.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "ids/id_generator.hpp"
#include "policy/status_policy.hpp"
#include "repo/repository.hpp"
#include "store/sqlite_db.hpp"
#include "store/transaction.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wires {

/// Seconds since the Unix epoch. Injected so tests can control time.
using Clock = std::function<Timestamp()>;

[[nodiscard]] Timestamp system_clock_now();

/**
 * @brief Result of a field update or status change.
 */
struct TransitionOutcome {
    Wire wire;                                  ///< State after the update
    std::vector<TransitionWarning> warnings;    ///< Non-empty only for Done
};

/**
 * @brief Whole-graph export: every wire and every edge.
 */
struct GraphSnapshot {
    std::vector<Wire> nodes;    ///< Same order as list()
    std::vector<Edge> edges;    ///< Ordered by (wire_id, depends_on)
};

class WireEngine {
public:
    /**
     * @brief Open the repository database and check its schema.
     *
     * @param ids    Defaults to HashIdGenerator when null.
     * @param clock  Defaults to system_clock_now() when empty.
     */
    static Result<std::unique_ptr<WireEngine>> open(const RepositoryHandle& handle,
                                                    const Config& config,
                                                    Logger& logger,
                                                    std::unique_ptr<IdGenerator> ids = nullptr,
                                                    Clock clock = {});

    // ── Wires ─────────────────────────────────
    Result<Wire> create(const std::string& title,
                        std::optional<std::string> description = std::nullopt,
                        Priority priority = 0);
    Result<WireWithDeps> get(const WireId& id);
    Result<std::vector<WireWithDeps>> list(std::optional<Status> status = std::nullopt);
    Result<void> remove(const WireId& id);

    // ── Transitions ───────────────────────────
    Result<TransitionOutcome> update(const WireId& id, const WireUpdate& update);
    Result<TransitionOutcome> start(const WireId& id);
    Result<TransitionOutcome> done(const WireId& id);
    Result<TransitionOutcome> cancel(const WireId& id);

    // ── Dependencies ──────────────────────────

    /**
     * @brief Record that `wire_id` depends on `depends_on`.
     *
     * @return true if a new edge was stored, false if it already existed.
     *         Fails with CircularDependency (Error::cycle set) when the edge
     *         would close a cycle.
     */
    Result<bool> add_dependency(const WireId& wire_id, const WireId& depends_on);

    /// Returns whether an edge was deleted; an absent edge is not an error.
    Result<bool> remove_dependency(const WireId& wire_id, const WireId& depends_on);

    // ── Queries ───────────────────────────────
    Result<std::vector<Wire>> ready();
    Result<GraphSnapshot> graph();

private:
    WireEngine(RepositoryHandle handle, const Config& config, Logger& logger,
               std::unique_ptr<SqliteDb> db, std::unique_ptr<IdGenerator> ids, Clock clock);

    Result<WireWithDeps> load_with_deps(Transaction& tx, const WireId& id) const;

    RepositoryHandle handle_;
    uint32_t max_id_attempts_;
    Logger& logger_;
    std::unique_ptr<SqliteDb> db_;
    std::unique_ptr<IdGenerator> ids_;
    Clock clock_;
};

}  // namespace wires
