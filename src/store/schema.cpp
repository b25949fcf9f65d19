/**
 * @file schema.cpp
 * @brief DDL for the wires database.
 */

#include "store/schema.hpp"

#include "store/transaction.hpp"

#include <string>

namespace wires {

namespace {

constexpr const char* kCreateTables = R"sql(
CREATE TABLE wires (
    id          TEXT PRIMARY KEY,
    title       TEXT NOT NULL,
    description TEXT,
    status      TEXT NOT NULL,
    created_at  INTEGER NOT NULL,
    updated_at  INTEGER NOT NULL,
    priority    INTEGER DEFAULT 0
);

CREATE TABLE dependencies (
    wire_id    TEXT NOT NULL,
    depends_on TEXT NOT NULL,
    FOREIGN KEY (wire_id)    REFERENCES wires(id) ON DELETE CASCADE,
    FOREIGN KEY (depends_on) REFERENCES wires(id) ON DELETE CASCADE,
    PRIMARY KEY (wire_id, depends_on)
);

CREATE INDEX idx_status    ON wires(status);
CREATE INDEX idx_priority  ON wires(priority);
CREATE INDEX idx_deps_wire ON dependencies(wire_id);
CREATE INDEX idx_deps_on   ON dependencies(depends_on);
)sql";

}  // namespace

Result<void> create_schema(SqliteDb& db) {
    auto tx = Transaction::begin(db, TransactionMode::Write);
    if (!tx) return tx.error();

    if (auto created = db.exec(kCreateTables); !created) return created;
    if (auto versioned = db.exec("PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
        !versioned) {
        return versioned;
    }
    return tx->commit();
}

Result<void> verify_schema(SqliteDb& db) {
    auto version = db.pragma("user_version");
    if (!version) return version.error();

    // Databases written before user_version was set report 0.
    if (*version != "0" && *version != std::to_string(kSchemaVersion)) {
        return Error{ErrorCode::StoreFailure,
                     "Unsupported schema version " + *version + " in " + db.path().string()};
    }

    auto stmt = db.prepare(
        "SELECT COUNT(*) FROM sqlite_master WHERE type='table' "
        "AND name IN ('wires','dependencies');");
    if (!stmt) return stmt.error();

    auto row = stmt->step();
    if (!row) return row.error();
    if (!*row || stmt->column_int64(0) != 2) {
        return Error{ErrorCode::StoreFailure, "Missing wires tables in " + db.path().string()};
    }
    return {};
}

}  // namespace wires
