/**
 * @file cycle_guard.hpp
 * @brief Rejects dependency edges that would close a cycle.
 *
 * Adding `task -> depends_on` closes a cycle exactly when `task` is already
 * reachable from `depends_on` along existing prerequisite edges. The search
 * is an explicit-stack DFS, so chain depth is bounded by memory rather than
 * the call stack, and each node is expanded at most once.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <optional>
#include <stack>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace wires {

/**
 * @brief Check whether adding `task_id -> depends_on` would create a cycle.
 *
 * Existence of both endpoints is the caller's precondition.
 *
 * @return nullopt when the edge is safe, otherwise the cycle as a path that
 *         starts and ends at `task_id`, e.g. [C, A, B, C] when A depends on
 *         B, B on C, and C -> A is proposed. A lookup failure from `source`
 *         is returned as-is.
 */
template <PrerequisiteSource Source>
Result<std::optional<std::vector<WireId>>> would_create_cycle(const Source& source,
                                                              const WireId& task_id,
                                                              const WireId& depends_on) {
    using Path = std::vector<WireId>;

    if (task_id == depends_on) {
        return std::optional<Path>{Path{task_id, task_id}};
    }

    std::unordered_set<WireId> visited;
    std::unordered_map<WireId, WireId> parent;   // node -> node it was reached from
    std::stack<WireId> pending;

    pending.push(depends_on);

    while (!pending.empty()) {
        WireId current = std::move(pending.top());
        pending.pop();

        if (current == task_id) {
            Path walk{task_id};
            WireId cursor = task_id;
            while (cursor != depends_on) {
                auto it = parent.find(cursor);
                if (it == parent.end()) {
                    return std::optional<Path>{Path{task_id, depends_on, task_id}};
                }
                cursor = it->second;
                walk.push_back(cursor);
            }
            // walk = [task, ..., depends_on]; the cycle reads forward from task.
            std::reverse(walk.begin(), walk.end());
            walk.insert(walk.begin(), task_id);
            return std::optional<Path>{std::move(walk)};
        }

        if (!visited.insert(current).second) {
            continue;
        }

        auto prerequisites = source.prerequisites_of(current);
        if (!prerequisites) {
            return prerequisites.error();
        }

        for (auto& next : *prerequisites) {
            if (visited.contains(next)) continue;
            if (!parent.contains(next)) {
                parent.emplace(next, current);
            }
            pending.push(std::move(next));
        }
    }

    return std::optional<Path>{};
}

}  // namespace wires
