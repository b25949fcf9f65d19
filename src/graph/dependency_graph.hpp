/**
 * @file dependency_graph.hpp
 * @brief In-memory view of wires and their dependency edges.
 *
 * Built from a store snapshot so readiness can be resolved without a query
 * per wire. Edges point from a wire to the wire it depends on.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <unordered_map>
#include <vector>

namespace wires {

class DependencyGraph {
public:
    DependencyGraph() = default;

    /**
     * @brief Build from stored wires and edges.
     *
     * An edge endpoint with no Wire record keeps its edge; find() returns
     * nullptr for it.
     */
    [[nodiscard]] static DependencyGraph from(const std::vector<Wire>& wires,
                                              const std::vector<Edge>& edges);

    void add_node(Wire wire);

    /// Returns false if the edge was already present.
    bool add_edge(const WireId& wire_id, const WireId& depends_on);

    /// Direct prerequisites of `id`, sorted. Satisfies PrerequisiteSource.
    [[nodiscard]] Result<std::vector<WireId>> prerequisites_of(const WireId& id) const;

    [[nodiscard]] const Wire* find(const WireId& id) const;
    [[nodiscard]] const std::unordered_map<WireId, Wire>& nodes() const noexcept { return wires_; }

private:
    std::unordered_map<WireId, Wire> wires_;
    std::unordered_map<WireId, std::vector<WireId>> prerequisites_;   // wire -> depends_on
};

}  // namespace wires
