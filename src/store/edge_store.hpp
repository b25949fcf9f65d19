/**
 * @file edge_store.hpp
 * @brief Persistence of dependency edges.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "store/transaction.hpp"

#include <optional>
#include <vector>

namespace wires {

/**
 * @brief Dependency edges bound to an open transaction.
 *
 * Satisfies PrerequisiteSource, so the cycle guard can walk the stored
 * graph inside the same transaction that will insert the new edge.
 */
class EdgeStore {
public:
    explicit EdgeStore(Transaction& tx) noexcept : tx_(&tx) {}

    /// INSERT OR IGNORE. Returns true when a new row was written.
    Result<bool> insert(const WireId& wire_id, const WireId& depends_on);

    /// Returns true when a row was deleted.
    Result<bool> remove(const WireId& wire_id, const WireId& depends_on);

    /// Delete every edge with `id` at either end.
    Result<void> remove_touching(const WireId& id);

    /// Direct prerequisites of `id`, sorted by id.
    [[nodiscard]] Result<std::vector<WireId>> prerequisites_of(const WireId& id) const;

    [[nodiscard]] Result<std::vector<DependencyInfo>> dependencies_of(const WireId& id) const;
    [[nodiscard]] Result<std::vector<DependencyInfo>> blocks_of(const WireId& id) const;

    /// Every edge, ordered by (wire_id, depends_on).
    [[nodiscard]] Result<std::vector<Edge>> all() const;

private:
    Result<std::vector<DependencyInfo>> neighbours(const char* sql, const WireId& id) const;

    Transaction* tx_;
    // Reused across the many lookups of a single cycle scan.
    mutable std::optional<Statement> prerequisites_stmt_;
};

}  // namespace wires
