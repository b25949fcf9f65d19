/**
 * @file sqlite_db.hpp
 * @brief Thin RAII wrappers around sqlite3 connections and statements.
 *
 * Driver types stay inside src/store/: everything above this layer sees
 * Result<T> and wires vocabulary types only.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace wires {

class SqliteDb;

/**
 * @brief Prepared statement, finalized on destruction.
 *
 * Bind indices are 1-based, column indices 0-based (sqlite3 conventions).
 */
class Statement {
public:
    Statement(sqlite3_stmt* stmt, sqlite3* db) noexcept : stmt_(stmt), db_(db) {}
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    Result<void> bind_text(int index, std::string_view value);
    Result<void> bind_int64(int index, int64_t value);

    /// Step once. true = a row is available, false = statement finished.
    Result<bool> step();

    /// Step until done, for statements that return no rows.
    Result<void> run();

    /// Reset and clear bindings so the statement can be executed again.
    void reset() noexcept;

    [[nodiscard]] std::string column_text(int col) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int col) const;
    [[nodiscard]] int64_t column_int64(int col) const;

private:
    Result<void> check_bind(int rc, int index);

    sqlite3_stmt* stmt_ = nullptr;
    sqlite3* db_ = nullptr;
};

/**
 * @brief Owning sqlite3 connection configured from StoreConfig.
 */
class SqliteDb {
public:
    enum class OpenMode : uint8_t {
        OpenExisting,   ///< Fail if the file is missing
        Create          ///< Create the file if needed
    };

    /**
     * @brief Open a connection and apply the connection PRAGMAs
     *        (journal mode, synchronous, foreign keys, busy timeout).
     */
    static Result<std::unique_ptr<SqliteDb>> open(const std::filesystem::path& path,
                                                  const StoreConfig& config,
                                                  OpenMode mode);

    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    [[nodiscard]] sqlite3* handle() const noexcept { return db_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// Execute one or more SQL statements (pragmas, DDL, transaction control).
    Result<void> exec(std::string_view sql);

    Result<Statement> prepare(std::string_view sql);

    /// Rows modified by the most recent INSERT/UPDATE/DELETE.
    [[nodiscard]] int64_t changes() const noexcept;

    /// Current value of a single-valued PRAGMA, e.g. "journal_mode".
    Result<std::string> pragma(std::string_view name);

private:
    SqliteDb(sqlite3* db, std::filesystem::path path) noexcept
        : db_(db), path_(std::move(path)) {}

    Result<void> configure(const StoreConfig& config);

    sqlite3* db_ = nullptr;
    std::filesystem::path path_;
};

/**
 * @brief Build a StoreFailure error from the connection's last message.
 */
[[nodiscard]] Error store_error(sqlite3* db, std::string_view context);

}  // namespace wires
