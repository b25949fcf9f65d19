/**
 * @file edge_store.cpp
 * @brief SQL for dependency edges.
 */

#include "store/edge_store.hpp"

#include <string>

namespace wires {

Result<bool> EdgeStore::insert(const WireId& wire_id, const WireId& depends_on) {
    auto stmt = tx_->db().prepare(
        "INSERT OR IGNORE INTO dependencies (wire_id, depends_on) VALUES (?1, ?2);");
    if (!stmt) return stmt.error();
    if (auto r = stmt->bind_text(1, wire_id); !r) return r.error();
    if (auto r = stmt->bind_text(2, depends_on); !r) return r.error();
    if (auto r = stmt->run(); !r) return r.error();
    return tx_->db().changes() > 0;
}

Result<bool> EdgeStore::remove(const WireId& wire_id, const WireId& depends_on) {
    auto stmt = tx_->db().prepare(
        "DELETE FROM dependencies WHERE wire_id = ?1 AND depends_on = ?2;");
    if (!stmt) return stmt.error();
    if (auto r = stmt->bind_text(1, wire_id); !r) return r.error();
    if (auto r = stmt->bind_text(2, depends_on); !r) return r.error();
    if (auto r = stmt->run(); !r) return r.error();
    return tx_->db().changes() > 0;
}

Result<void> EdgeStore::remove_touching(const WireId& id) {
    auto stmt = tx_->db().prepare(
        "DELETE FROM dependencies WHERE wire_id = ?1 OR depends_on = ?1;");
    if (!stmt) return stmt.error();
    if (auto r = stmt->bind_text(1, id); !r) return r;
    return stmt->run();
}

Result<std::vector<WireId>> EdgeStore::prerequisites_of(const WireId& id) const {
    if (!prerequisites_stmt_) {
        auto stmt = tx_->db().prepare(
            "SELECT depends_on FROM dependencies WHERE wire_id = ?1 ORDER BY depends_on;");
        if (!stmt) return stmt.error();
        prerequisites_stmt_.emplace(std::move(*stmt));
    }

    Statement& stmt = *prerequisites_stmt_;
    stmt.reset();
    if (auto r = stmt.bind_text(1, id); !r) return r.error();

    std::vector<WireId> prerequisites;
    while (true) {
        auto row = stmt.step();
        if (!row) return row.error();
        if (!*row) break;
        prerequisites.push_back(stmt.column_text(0));
    }
    return prerequisites;
}

Result<std::vector<DependencyInfo>> EdgeStore::neighbours(const char* sql,
                                                          const WireId& id) const {
    auto stmt = tx_->db().prepare(sql);
    if (!stmt) return stmt.error();
    if (auto r = stmt->bind_text(1, id); !r) return r.error();

    std::vector<DependencyInfo> infos;
    while (true) {
        auto row = stmt->step();
        if (!row) return row.error();
        if (!*row) break;

        auto label = stmt->column_text(2);
        auto status = status_from_string(label);
        if (!status) {
            return Error{ErrorCode::StoreFailure,
                         "Corrupt status '" + label + "' stored for wire " + stmt->column_text(0)};
        }
        infos.push_back(DependencyInfo{stmt->column_text(0), stmt->column_text(1), *status});
    }
    return infos;
}

Result<std::vector<DependencyInfo>> EdgeStore::dependencies_of(const WireId& id) const {
    return neighbours(
        "SELECT w.id, w.title, w.status FROM dependencies d "
        "JOIN wires w ON w.id = d.depends_on "
        "WHERE d.wire_id = ?1 ORDER BY w.id;",
        id);
}

Result<std::vector<DependencyInfo>> EdgeStore::blocks_of(const WireId& id) const {
    return neighbours(
        "SELECT w.id, w.title, w.status FROM dependencies d "
        "JOIN wires w ON w.id = d.wire_id "
        "WHERE d.depends_on = ?1 ORDER BY w.id;",
        id);
}

Result<std::vector<Edge>> EdgeStore::all() const {
    auto stmt = tx_->db().prepare(
        "SELECT wire_id, depends_on FROM dependencies ORDER BY wire_id, depends_on;");
    if (!stmt) return stmt.error();

    std::vector<Edge> edges;
    while (true) {
        auto row = stmt->step();
        if (!row) return row.error();
        if (!*row) break;
        edges.push_back(Edge{stmt->column_text(0), stmt->column_text(1)});
    }
    return edges;
}

}  // namespace wires
