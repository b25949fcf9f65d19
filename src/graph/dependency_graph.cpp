/**
 * @file dependency_graph.cpp
 * @brief DependencyGraph implementation.
 */

#include "graph/dependency_graph.hpp"

#include <algorithm>

namespace wires {

DependencyGraph DependencyGraph::from(const std::vector<Wire>& wires,
                                      const std::vector<Edge>& edges) {
    DependencyGraph graph;
    for (const auto& wire : wires) {
        graph.add_node(wire);
    }
    for (const auto& edge : edges) {
        graph.add_edge(edge.wire_id, edge.depends_on);
    }
    return graph;
}

void DependencyGraph::add_node(Wire wire) {
    WireId id = wire.id;
    wires_.insert_or_assign(std::move(id), std::move(wire));
}

bool DependencyGraph::add_edge(const WireId& wire_id, const WireId& depends_on) {
    // Kept sorted so prerequisites_of() matches the store's ORDER BY.
    auto& prereqs = prerequisites_[wire_id];
    auto it = std::lower_bound(prereqs.begin(), prereqs.end(), depends_on);
    if (it != prereqs.end() && *it == depends_on) return false;
    prereqs.insert(it, depends_on);
    return true;
}

Result<std::vector<WireId>> DependencyGraph::prerequisites_of(const WireId& id) const {
    auto it = prerequisites_.find(id);
    if (it == prerequisites_.end()) return std::vector<WireId>{};
    return it->second;
}

const Wire* DependencyGraph::find(const WireId& id) const {
    auto it = wires_.find(id);
    return it == wires_.end() ? nullptr : &it->second;
}

}  // namespace wires
