/**
 * @file readiness.cpp
 * @brief Readiness resolution over a DependencyGraph snapshot.
 */

#include "graph/readiness.hpp"

#include <algorithm>
#include <tuple>

namespace wires {

bool ReadyOrder::operator()(const Wire& a, const Wire& b) const noexcept {
    return std::forward_as_tuple(status_rank(a.status), b.priority, a.created_at, a.id)
         < std::forward_as_tuple(status_rank(b.status), a.priority, b.created_at, b.id);
}

bool is_ready(const Wire& wire, const DependencyGraph& graph) {
    if (!is_blocking(wire.status)) return false;

    auto prerequisites = graph.prerequisites_of(wire.id);
    if (!prerequisites) return false;

    return std::all_of(prerequisites->begin(), prerequisites->end(), [&](const WireId& dep) {
        const Wire* prerequisite = graph.find(dep);
        // Dangling edges cannot exist under the foreign keys; treat as satisfied.
        return prerequisite == nullptr || prerequisite->status == Status::Done;
    });
}

std::vector<Wire> resolve_ready(const DependencyGraph& graph) {
    std::vector<Wire> ready;
    for (const auto& [id, wire] : graph.nodes()) {
        if (is_ready(wire, graph)) {
            ready.push_back(wire);
        }
    }
    std::sort(ready.begin(), ready.end(), ReadyOrder{});
    return ready;
}

}  // namespace wires
