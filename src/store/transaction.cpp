/**
 * @file transaction.cpp
 * @brief Scoped SQLite transaction implementation.
 */

#include "store/transaction.hpp"

#include <utility>

namespace wires {

Result<Transaction> Transaction::begin(SqliteDb& db, TransactionMode mode) {
    auto started = db.exec(mode == TransactionMode::Write ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    if (!started) return started.error();
    return Transaction{db};
}

Transaction::Transaction(Transaction&& other) noexcept
    : db_(other.db_)
    , active_(std::exchange(other.active_, false)) {}

Transaction::~Transaction() {
    if (!active_) return;
    // No caller is left to report to. sqlite3 itself abandons the
    // transaction when the connection closes, so a failed ROLLBACK here
    // cannot leak a partial write.
    sqlite3_exec(db_->handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
}

Result<void> Transaction::commit() {
    if (!active_) {
        return Error{ErrorCode::StoreFailure, "commit on a finished transaction"};
    }
    auto done = db_->exec("COMMIT;");
    if (!done) return done;
    active_ = false;
    return {};
}

Result<void> Transaction::rollback() {
    if (!active_) return {};
    active_ = false;
    return db_->exec("ROLLBACK;");
}

}  // namespace wires
