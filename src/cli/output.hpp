/**
 * @file output.hpp
 * @brief Rendering of command results as JSON, tables and DOT.
 *
 * JSON field names are stable: id, title, description, status, priority,
 * created_at, updated_at, depends_on, blocks. Every renderer returns a
 * complete string without a trailing newline unless noted.
 */

#pragma once

#include "cli/options.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/wire_engine.hpp"

#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wires::cli {

[[nodiscard]] bool is_terminal(std::FILE* stream) noexcept;

/**
 * @brief Pick the output format.
 *
 * An explicit flag wins, then a "json"/"table" setting from the config
 * file; otherwise table on a terminal and JSON everywhere else.
 */
[[nodiscard]] OutputFormat resolve_format(std::optional<OutputFormat> flag,
                                          const std::string& configured,
                                          bool stdout_is_tty);

// ── JSON ─────────────────────────────────────
[[nodiscard]] std::string wire_json(const Wire& wire);
[[nodiscard]] std::string wire_detail_json(const WireWithDeps& wire);
[[nodiscard]] std::string wires_json(const std::vector<Wire>& wires);
[[nodiscard]] std::string wire_details_json(const std::vector<WireWithDeps>& wires);

/// Acknowledgement for `new`.
[[nodiscard]] std::string created_json(const Wire& wire);

/// Acknowledgement for update/start/done/cancel, with warnings when present.
[[nodiscard]] std::string transition_json(const TransitionOutcome& outcome, bool with_priority);

[[nodiscard]] std::string edge_action_json(const WireId& wire_id, const WireId& depends_on,
                                           std::string_view action);
[[nodiscard]] std::string graph_json(const GraphSnapshot& graph);

// ── Text ─────────────────────────────────────

/// One line per wire with a `← blocked by` suffix; newline-terminated.
[[nodiscard]] std::string wire_table(const std::vector<WireWithDeps>& wires);
[[nodiscard]] std::string ready_table(const std::vector<Wire>& wires);

/// Header, description, then "Depends on:" and "Blocks:" sections.
[[nodiscard]] std::string wire_detail_table(const WireWithDeps& wire);

/// GraphViz digraph, edges pointing from a wire to its prerequisite.
[[nodiscard]] std::string graph_dot(const GraphSnapshot& graph);

// ── Errors ───────────────────────────────────

/// `{"error":"…"}`, plus `"cycle":[…]` for circular dependencies.
[[nodiscard]] std::string error_json(const Error& error);
[[nodiscard]] std::string error_text(const Error& error);

}  // namespace wires::cli
