/**
 * @file readiness.hpp
 * @brief Which wires can be worked on now, and in what order.
 *
 * A wire is ready when it is Todo or InProgress and every direct
 * prerequisite is Done. Cancelled prerequisites do not count as Done.
 */

#pragma once

#include "core/types.hpp"
#include "graph/dependency_graph.hpp"

#include <vector>

namespace wires {

/// InProgress sorts before Todo; everything else after both.
[[nodiscard]] constexpr int status_rank(Status status) noexcept {
    switch (status) {
        case Status::InProgress: return 0;
        case Status::Todo:       return 1;
        case Status::Done:       return 2;
        case Status::Cancelled:  return 3;
    }
    return 4;
}

/**
 * @brief Strict weak order for the ready list.
 *
 * status rank, then priority descending, then created_at ascending,
 * then id ascending.
 */
struct ReadyOrder {
    [[nodiscard]] bool operator()(const Wire& a, const Wire& b) const noexcept;
};

[[nodiscard]] bool is_ready(const Wire& wire, const DependencyGraph& graph);

/// Every ready wire in `graph`, sorted by ReadyOrder.
[[nodiscard]] std::vector<Wire> resolve_ready(const DependencyGraph& graph);

}  // namespace wires
