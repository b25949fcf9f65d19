/**
 * @file transaction.hpp
 * @brief Scoped SQLite transaction.
 *
 * Semantics:
 *   - Write transactions use BEGIN IMMEDIATE and take the database's
 *     reserved lock up front, so every check-then-write sequence (existence
 *     checks, cycle scan, insert) is serialized against other writers.
 *   - Read transactions use BEGIN DEFERRED; under WAL they read a stable
 *     snapshot and never block on a writer.
 *   - Changes are invisible to other connections until commit().
 *   - The destructor rolls back if commit() was not reached.
 */

#pragma once

#include "core/result.hpp"
#include "store/sqlite_db.hpp"

#include <cstdint>

namespace wires {

enum class TransactionMode : uint8_t {
    Read,
    Write
};

class Transaction {
public:
    static Result<Transaction> begin(SqliteDb& db, TransactionMode mode);

    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&&) = delete;

    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] SqliteDb& db() const noexcept { return *db_; }
    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    explicit Transaction(SqliteDb& db) noexcept : db_(&db), active_(true) {}

    SqliteDb* db_;
    bool active_;
};

}  // namespace wires
