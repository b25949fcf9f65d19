/**
 * @file types.hpp
 * @brief Fundamental types used throughout wires.
 *
 * Defines WireId, Status, Wire, the dependency edge and the neighbour
 * summaries exposed by detail views. All types are plain values.
 */

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wires {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using WireId = std::string;
using Timestamp = int64_t;          ///< Seconds since the Unix epoch
using Priority = int32_t;

// ─────────────────────────────────────────────
// Status
// ─────────────────────────────────────────────

enum class Status : uint8_t {
    Todo,
    InProgress,
    Done,
    Cancelled
};

/**
 * @brief Persisted label of a status ("TODO", "IN_PROGRESS", ...).
 */
[[nodiscard]] constexpr std::string_view to_string(Status status) noexcept {
    switch (status) {
        case Status::Todo:       return "TODO";
        case Status::InProgress: return "IN_PROGRESS";
        case Status::Done:       return "DONE";
        case Status::Cancelled:  return "CANCELLED";
    }
    return "UNKNOWN";
}

/**
 * @brief Strict inverse of to_string(). Only the persisted labels map.
 */
[[nodiscard]] constexpr std::optional<Status> status_from_string(std::string_view label) noexcept {
    if (label == "TODO")        return Status::Todo;
    if (label == "IN_PROGRESS") return Status::InProgress;
    if (label == "DONE")        return Status::Done;
    if (label == "CANCELLED")   return Status::Cancelled;
    return std::nullopt;
}

/**
 * @brief Single-character marker used by table output.
 */
[[nodiscard]] constexpr std::string_view status_symbol(Status status) noexcept {
    switch (status) {
        case Status::Todo:       return "○";
        case Status::InProgress: return "◐";
        case Status::Done:       return "●";
        case Status::Cancelled:  return "⊘";
    }
    return "?";
}

/// A dependency in this status still holds up the wires that depend on it.
[[nodiscard]] constexpr bool is_blocking(Status status) noexcept {
    return status == Status::Todo || status == Status::InProgress;
}

// ─────────────────────────────────────────────
// Wire
// ─────────────────────────────────────────────

/**
 * @brief One unit of trackable work.
 */
struct Wire {
    WireId id;
    std::string title;
    std::optional<std::string> description;
    Status status = Status::Todo;
    Priority priority = 0;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;

    bool operator==(const Wire&) const = default;
};

/**
 * @brief Directed edge: `wire_id` cannot be ready until `depends_on` is Done.
 */
struct Edge {
    WireId wire_id;
    WireId depends_on;

    auto operator<=>(const Edge&) const = default;
};

/**
 * @brief Neighbour summary embedded in detail views.
 */
struct DependencyInfo {
    WireId id;
    std::string title;
    Status status = Status::Todo;

    bool operator==(const DependencyInfo&) const = default;
};

/**
 * @brief A wire together with its neighbours in both directions.
 */
struct WireWithDeps {
    Wire wire;
    std::vector<DependencyInfo> depends_on;   ///< Prerequisites of `wire`
    std::vector<DependencyInfo> blocks;       ///< Wires that depend on `wire`
};

/**
 * @brief Multi-field update. Unset fields are left unchanged.
 *
 * `description` is doubly optional: an engaged empty string clears the
 * stored description, a disengaged one leaves it alone.
 */
struct WireUpdate {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<Status> status;
    std::optional<Priority> priority;

    [[nodiscard]] bool empty() const noexcept {
        return !title && !description && !status && !priority;
    }
};

}  // namespace wires
