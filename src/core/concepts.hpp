/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for wires interfaces.
 *
 * Graph algorithms are written against these concepts so the same code runs
 * over the SQLite stores and over in-memory graphs without virtual dispatch.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <vector>

namespace wires {

// ─────────────────────────────────────────────
// PrerequisiteSource
// ─────────────────────────────────────────────

/**
 * @concept PrerequisiteSource
 * @brief Types that can list the direct prerequisites of a wire.
 *
 * Satisfied by EdgeStore (reads inside the caller's transaction) and by
 * DependencyGraph (in-memory adjacency).
 */
template <typename T>
concept PrerequisiteSource = requires(const T source, const WireId& id) {
    { source.prerequisites_of(id) } -> std::same_as<Result<std::vector<WireId>>>;
};

}  // namespace wires
