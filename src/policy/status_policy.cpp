/**
 * @file status_policy.cpp
 * @brief Status label parsing and transition warnings.
 */

#include "policy/status_policy.hpp"

#include <cctype>
#include <string>

namespace wires {

Result<Status> parse_status_label(std::string_view label) {
    std::string normalized;
    normalized.reserve(label.size());
    for (char c : label) {
        normalized.push_back(c == '-' ? '_'
                                      : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (auto status = status_from_string(normalized)) {
        return *status;
    }
    return Error{ErrorCode::InvalidStatusValue, "Invalid status: " + std::string{label}};
}

std::vector<TransitionWarning> warnings_for(Status target,
                                            const std::vector<DependencyInfo>& dependencies) {
    std::vector<TransitionWarning> warnings;
    if (target != Status::Done) return warnings;

    for (const auto& dep : dependencies) {
        if (dep.status != Status::Done) {
            warnings.push_back(TransitionWarning{dep.id, dep.status});
        }
    }
    return warnings;
}

std::vector<WireId> blockers(const std::vector<DependencyInfo>& dependencies) {
    std::vector<WireId> ids;
    for (const auto& dep : dependencies) {
        if (is_blocking(dep.status)) {
            ids.push_back(dep.id);
        }
    }
    return ids;
}

}  // namespace wires
