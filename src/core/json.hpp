/**
 * @file json.hpp
 * @brief Minimal JSON string helpers for hand-built NDJSON and CLI output.
 */

#pragma once

#include <string>
#include <string_view>

namespace wires {

/**
 * @brief Escape a string for inclusion between JSON double quotes.
 *
 * Handles quotes, backslashes and all control characters below 0x20.
 * Multi-byte UTF-8 sequences pass through unchanged.
 */
[[nodiscard]] std::string json_escape(std::string_view text);

/// json_escape() wrapped in double quotes.
[[nodiscard]] std::string json_quote(std::string_view text);

}  // namespace wires
