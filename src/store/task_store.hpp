/**
 * @file task_store.hpp
 * @brief Persistence of wire records.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "store/transaction.hpp"

#include <optional>
#include <vector>

namespace wires {

/**
 * @brief Wire CRUD bound to an open transaction.
 *
 * A TaskStore is a cheap view; construct one per unit of work. Writes
 * through a read transaction are rejected by sqlite itself.
 */
class TaskStore {
public:
    explicit TaskStore(Transaction& tx) noexcept : tx_(&tx) {}

    Result<void> insert(const Wire& wire);

    [[nodiscard]] Result<std::optional<Wire>> find(const WireId& id) const;
    [[nodiscard]] Result<bool> exists(const WireId& id) const;

    /// Newest first (created_at DESC, then id), optionally filtered by status.
    [[nodiscard]] Result<std::vector<Wire>> list(std::optional<Status> status = std::nullopt) const;

    /**
     * @brief Apply the set fields of `update` and refresh updated_at.
     *
     * updated_at becomes max(previous, now), so it never moves backwards.
     * Returns false when no wire has this id. An empty update is a no-op
     * that still reports whether the wire exists.
     */
    Result<bool> update(const WireId& id, const WireUpdate& update, Timestamp now);

    /// Returns false when no wire has this id.
    Result<bool> remove(const WireId& id);

private:
    Transaction* tx_;
};

}  // namespace wires
