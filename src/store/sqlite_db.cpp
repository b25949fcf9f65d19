/**
 * @file sqlite_db.cpp
 * @brief sqlite3 connection and statement wrappers.
 */

#include "store/sqlite_db.hpp"

#include <utility>

namespace wires {

Error store_error(sqlite3* db, std::string_view context) {
    std::string message{context};
    message += ": ";
    message += db ? sqlite3_errmsg(db) : "sqlite error";
    return Error{ErrorCode::StoreFailure, std::move(message)};
}

// ─────────────────────────────────────────────
// Statement
// ─────────────────────────────────────────────

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : stmt_(std::exchange(other.stmt_, nullptr))
    , db_(std::exchange(other.db_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
        db_ = std::exchange(other.db_, nullptr);
    }
    return *this;
}

Result<void> Statement::check_bind(int rc, int index) {
    if (rc != SQLITE_OK) {
        return store_error(db_, "bind parameter " + std::to_string(index));
    }
    return {};
}

Result<void> Statement::bind_text(int index, std::string_view value) {
    return check_bind(sqlite3_bind_text(stmt_, index, value.data(),
                                        static_cast<int>(value.size()), SQLITE_TRANSIENT),
                      index);
}

Result<void> Statement::bind_int64(int index, int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), index);
}

Result<bool> Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    return store_error(db_, "step");
}

Result<void> Statement::run() {
    while (true) {
        auto row = step();
        if (!row) return row.error();
        if (!*row) return {};
    }
}

void Statement::reset() noexcept {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::optional<std::string> Statement::column_optional_text(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return column_text(col);
}

int64_t Statement::column_int64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

// ─────────────────────────────────────────────
// SqliteDb
// ─────────────────────────────────────────────

Result<std::unique_ptr<SqliteDb>> SqliteDb::open(const std::filesystem::path& path,
                                                 const StoreConfig& config,
                                                 OpenMode mode) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
    if (mode == OpenMode::Create) flags |= SQLITE_OPEN_CREATE;

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    if (rc != SQLITE_OK) {
        Error err = store_error(raw, "open " + path.string());
        if (raw) sqlite3_close(raw);
        return err;
    }

    std::unique_ptr<SqliteDb> db{new SqliteDb(raw, path)};
    if (auto configured = db->configure(config); !configured) {
        return configured.error();
    }
    return std::move(db);
}

SqliteDb::~SqliteDb() {
    if (db_) sqlite3_close(db_);
}

Result<void> SqliteDb::exec(std::string_view sql) {
    std::string owned{sql};
    char* err = nullptr;
    int rc = sqlite3_exec(db_, owned.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        return Error{ErrorCode::StoreFailure, "exec '" + owned + "': " + message};
    }
    return {};
}

Result<Statement> SqliteDb::prepare(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return store_error(db_, "prepare");
    }
    return Statement{stmt, db_};
}

int64_t SqliteDb::changes() const noexcept {
    return static_cast<int64_t>(sqlite3_changes(db_));
}

Result<std::string> SqliteDb::pragma(std::string_view name) {
    auto stmt = prepare("PRAGMA " + std::string{name} + ";");
    if (!stmt) return stmt.error();

    auto row = stmt->step();
    if (!row) return row.error();
    if (!*row) return std::string{};
    return stmt->column_text(0);
}

Result<void> SqliteDb::configure(const StoreConfig& config) {
    // Wait on other writers instead of failing immediately with SQLITE_BUSY.
    if (sqlite3_busy_timeout(db_, static_cast<int>(config.busy_timeout_ms)) != SQLITE_OK) {
        return store_error(db_, "busy_timeout");
    }

    // WAL lets readers run alongside the single writer.
    if (auto r = exec("PRAGMA journal_mode=" + config.journal_mode + ";"); !r) return r;
    if (auto r = exec("PRAGMA synchronous=" + config.synchronous + ";"); !r) return r;

    // Off by default in sqlite; the schema relies on ON DELETE CASCADE.
    if (auto r = exec("PRAGMA foreign_keys=ON;"); !r) return r;

    return {};
}

}  // namespace wires
