/**
 * @file task_store.cpp
 * @brief SQL for wire records.
 */

#include "store/task_store.hpp"

#include <string>

namespace wires {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, title, description, status, created_at, updated_at, priority FROM wires";

/// Decode the current row of a kSelectColumns query.
Result<Wire> wire_from_row(const Statement& stmt) {
    auto label = stmt.column_text(3);
    auto status = status_from_string(label);
    if (!status) {
        return Error{ErrorCode::StoreFailure, "Corrupt status '" + label + "' stored for wire "
                                              + stmt.column_text(0)};
    }

    Wire wire;
    wire.id = stmt.column_text(0);
    wire.title = stmt.column_text(1);
    wire.description = stmt.column_optional_text(2);
    if (wire.description && wire.description->empty()) {
        wire.description.reset();
    }
    wire.status = *status;
    wire.created_at = stmt.column_int64(4);
    wire.updated_at = stmt.column_int64(5);
    wire.priority = static_cast<Priority>(stmt.column_int64(6));
    return wire;
}

Result<std::vector<Wire>> collect_wires(Statement& stmt) {
    std::vector<Wire> wires;
    while (true) {
        auto row = stmt.step();
        if (!row) return row.error();
        if (!*row) break;

        auto wire = wire_from_row(stmt);
        if (!wire) return wire.error();
        wires.push_back(std::move(*wire));
    }
    return wires;
}

}  // namespace

Result<void> TaskStore::insert(const Wire& wire) {
    auto stmt = tx_->db().prepare(
        "INSERT INTO wires (id, title, description, status, created_at, updated_at, priority) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7);");
    if (!stmt) return stmt.error();

    if (auto r = stmt->bind_text(1, wire.id); !r) return r;
    if (auto r = stmt->bind_text(2, wire.title); !r) return r;
    if (auto r = stmt->bind_text(3, wire.description.value_or(std::string{})); !r) return r;
    if (auto r = stmt->bind_text(4, to_string(wire.status)); !r) return r;
    if (auto r = stmt->bind_int64(5, wire.created_at); !r) return r;
    if (auto r = stmt->bind_int64(6, wire.updated_at); !r) return r;
    if (auto r = stmt->bind_int64(7, wire.priority); !r) return r;

    return stmt->run();
}

Result<std::optional<Wire>> TaskStore::find(const WireId& id) const {
    auto stmt = tx_->db().prepare(std::string{kSelectColumns} + " WHERE id = ?1;");
    if (!stmt) return stmt.error();
    if (auto r = stmt->bind_text(1, id); !r) return r.error();

    auto row = stmt->step();
    if (!row) return row.error();
    if (!*row) return std::optional<Wire>{};

    auto wire = wire_from_row(*stmt);
    if (!wire) return wire.error();
    return std::optional<Wire>{std::move(*wire)};
}

Result<bool> TaskStore::exists(const WireId& id) const {
    auto stmt = tx_->db().prepare("SELECT 1 FROM wires WHERE id = ?1;");
    if (!stmt) return stmt.error();
    if (auto r = stmt->bind_text(1, id); !r) return r.error();
    return stmt->step();
}

Result<std::vector<Wire>> TaskStore::list(std::optional<Status> status) const {
    std::string sql{kSelectColumns};
    if (status) sql += " WHERE status = ?1";
    sql += " ORDER BY created_at DESC, id ASC;";

    auto stmt = tx_->db().prepare(sql);
    if (!stmt) return stmt.error();
    if (status) {
        if (auto r = stmt->bind_text(1, to_string(*status)); !r) return r.error();
    }
    return collect_wires(*stmt);
}

Result<bool> TaskStore::update(const WireId& id, const WireUpdate& update, Timestamp now) {
    if (update.empty()) {
        return exists(id);
    }

    std::string sql = "UPDATE wires SET ";
    int index = 1;
    auto assign = [&](const char* column) {
        sql += column;
        sql += " = ?" + std::to_string(index++) + ", ";
    };
    if (update.title)       assign("title");
    if (update.description) assign("description");
    if (update.status)      assign("status");
    if (update.priority)    assign("priority");
    const int now_index = index++;
    const int id_index = index;
    sql += "updated_at = MAX(updated_at, ?" + std::to_string(now_index) + ")"
         + " WHERE id = ?" + std::to_string(id_index) + ";";

    auto stmt = tx_->db().prepare(sql);
    if (!stmt) return stmt.error();

    int bind = 1;
    if (update.title) {
        if (auto r = stmt->bind_text(bind++, *update.title); !r) return r.error();
    }
    if (update.description) {
        if (auto r = stmt->bind_text(bind++, *update.description); !r) return r.error();
    }
    if (update.status) {
        if (auto r = stmt->bind_text(bind++, to_string(*update.status)); !r) return r.error();
    }
    if (update.priority) {
        if (auto r = stmt->bind_int64(bind++, *update.priority); !r) return r.error();
    }
    if (auto r = stmt->bind_int64(now_index, now); !r) return r.error();
    if (auto r = stmt->bind_text(id_index, id); !r) return r.error();

    if (auto r = stmt->run(); !r) return r.error();
    return tx_->db().changes() > 0;
}

Result<bool> TaskStore::remove(const WireId& id) {
    auto stmt = tx_->db().prepare("DELETE FROM wires WHERE id = ?1;");
    if (!stmt) return stmt.error();
    if (auto r = stmt->bind_text(1, id); !r) return r.error();
    if (auto r = stmt->run(); !r) return r.error();
    return tx_->db().changes() > 0;
}

}  // namespace wires
