/**
 * @file status_policy.hpp
 * @brief Status transitions, their warnings, and blocker computation.
 *
 * Every status may move to every other status; nothing is forbidden.
 * Completing a wire whose prerequisites are not all Done succeeds but
 * yields one warning per unfinished prerequisite.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string_view>
#include <vector>

namespace wires {

/**
 * @brief Non-fatal notice attached to a transition.
 *
 * Only one kind exists today: a Done wire with an unfinished prerequisite.
 */
struct TransitionWarning {
    WireId wire_id;     ///< The unfinished prerequisite
    Status status = Status::Todo;

    [[nodiscard]] static constexpr std::string_view type() noexcept {
        return "incomplete_dependency";
    }

    bool operator==(const TransitionWarning&) const = default;
};

/**
 * @brief Parse a user-supplied status label.
 *
 * Case-insensitive, and `-` is accepted in place of `_`, so "in-progress",
 * "In_Progress" and "IN_PROGRESS" all parse. Anything else fails with
 * ErrorCode::InvalidStatusValue.
 */
[[nodiscard]] Result<Status> parse_status_label(std::string_view label);

/**
 * @brief Warnings produced by moving a wire to `target`.
 *
 * @param dependencies  The wire's direct prerequisites.
 */
[[nodiscard]] std::vector<TransitionWarning> warnings_for(
    Status target, const std::vector<DependencyInfo>& dependencies);

/// Prerequisites that still hold the wire up (Todo or InProgress).
[[nodiscard]] std::vector<WireId> blockers(const std::vector<DependencyInfo>& dependencies);

/**
 * @brief Whether `from -> to` follows the usual forward flow.
 *
 * Todo -> InProgress -> Done, and anything -> Cancelled. Other moves
 * (reopening, skipping ahead) are allowed but reported at debug level.
 */
[[nodiscard]] constexpr bool is_conventional_transition(Status from, Status to) noexcept {
    if (from == to || to == Status::Cancelled) return true;
    switch (from) {
        case Status::Todo:       return to == Status::InProgress || to == Status::Done;
        case Status::InProgress: return to == Status::Done;
        case Status::Done:
        case Status::Cancelled:  return false;
    }
    return false;
}

}  // namespace wires
