/**
 * @file output.cpp
 * @brief Output renderers for `wr`.
 */

#include "cli/output.hpp"

#include "core/json.hpp"
#include "policy/status_policy.hpp"

#include <sstream>

#include <unistd.h>

namespace wires::cli {

namespace {

void append_wire_fields(std::ostringstream& oss, const Wire& wire) {
    oss << R"("id":)" << json_quote(wire.id)
        << R"(,"title":)" << json_quote(wire.title);
    if (wire.description) {
        oss << R"(,"description":)" << json_quote(*wire.description);
    }
    oss << R"(,"status":)" << json_quote(to_string(wire.status))
        << R"(,"created_at":)" << wire.created_at
        << R"(,"updated_at":)" << wire.updated_at
        << R"(,"priority":)" << wire.priority;
}

void append_neighbours(std::ostringstream& oss, const std::vector<DependencyInfo>& infos) {
    oss << '[';
    for (size_t i = 0; i < infos.size(); ++i) {
        if (i > 0) oss << ',';
        oss << R"({"id":)" << json_quote(infos[i].id)
            << R"(,"title":)" << json_quote(infos[i].title)
            << R"(,"status":)" << json_quote(to_string(infos[i].status)) << '}';
    }
    oss << ']';
}

void append_detail(std::ostringstream& oss, const WireWithDeps& detail) {
    oss << '{';
    append_wire_fields(oss, detail.wire);
    oss << R"(,"depends_on":)";
    append_neighbours(oss, detail.depends_on);
    oss << R"(,"blocks":)";
    append_neighbours(oss, detail.blocks);
    oss << '}';
}

void append_row(std::ostringstream& oss, Status status, const WireId& id, const std::string& title) {
    oss << status_symbol(status) << ' ' << id << "  " << title;
}

}  // namespace

bool is_terminal(std::FILE* stream) noexcept {
    return stream != nullptr && ::isatty(::fileno(stream)) == 1;
}

OutputFormat resolve_format(std::optional<OutputFormat> flag,
                            const std::string& configured,
                            bool stdout_is_tty) {
    if (flag) return *flag;
    if (configured == "json") return OutputFormat::Json;
    if (configured == "table") return OutputFormat::Table;
    return stdout_is_tty ? OutputFormat::Table : OutputFormat::Json;
}

// ─────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────

std::string wire_json(const Wire& wire) {
    std::ostringstream oss;
    oss << '{';
    append_wire_fields(oss, wire);
    oss << '}';
    return oss.str();
}

std::string wire_detail_json(const WireWithDeps& wire) {
    std::ostringstream oss;
    append_detail(oss, wire);
    return oss.str();
}

std::string wires_json(const std::vector<Wire>& wires) {
    std::ostringstream oss;
    oss << '[';
    for (size_t i = 0; i < wires.size(); ++i) {
        if (i > 0) oss << ',';
        oss << '{';
        append_wire_fields(oss, wires[i]);
        oss << '}';
    }
    oss << ']';
    return oss.str();
}

std::string wire_details_json(const std::vector<WireWithDeps>& wires) {
    std::ostringstream oss;
    oss << '[';
    for (size_t i = 0; i < wires.size(); ++i) {
        if (i > 0) oss << ',';
        append_detail(oss, wires[i]);
    }
    oss << ']';
    return oss.str();
}

std::string created_json(const Wire& wire) {
    std::ostringstream oss;
    oss << R"({"id":)" << json_quote(wire.id)
        << R"(,"title":)" << json_quote(wire.title)
        << R"(,"status":)" << json_quote(to_string(wire.status))
        << R"(,"priority":)" << wire.priority
        << R"(,"created_at":)" << wire.created_at << '}';
    return oss.str();
}

std::string transition_json(const TransitionOutcome& outcome, bool with_priority) {
    const Wire& wire = outcome.wire;
    std::ostringstream oss;
    oss << R"({"id":)" << json_quote(wire.id)
        << R"(,"status":)" << json_quote(to_string(wire.status));
    if (with_priority) {
        oss << R"(,"priority":)" << wire.priority;
    }
    oss << R"(,"updated_at":)" << wire.updated_at;

    if (!outcome.warnings.empty()) {
        oss << R"(,"warnings":[)";
        for (size_t i = 0; i < outcome.warnings.size(); ++i) {
            const auto& warning = outcome.warnings[i];
            if (i > 0) oss << ',';
            oss << R"({"type":)" << json_quote(TransitionWarning::type())
                << R"(,"wire_id":)" << json_quote(warning.wire_id)
                << R"(,"status":)" << json_quote(to_string(warning.status)) << '}';
        }
        oss << ']';
    }
    oss << '}';
    return oss.str();
}

std::string edge_action_json(const WireId& wire_id, const WireId& depends_on,
                             std::string_view action) {
    std::ostringstream oss;
    oss << R"({"wire_id":)" << json_quote(wire_id)
        << R"(,"depends_on":)" << json_quote(depends_on)
        << R"(,"action":)" << json_quote(action) << '}';
    return oss.str();
}

std::string graph_json(const GraphSnapshot& graph) {
    std::ostringstream oss;
    oss << R"({"nodes":[)";
    for (size_t i = 0; i < graph.nodes.size(); ++i) {
        const auto& node = graph.nodes[i];
        if (i > 0) oss << ',';
        oss << R"({"id":)" << json_quote(node.id)
            << R"(,"title":)" << json_quote(node.title)
            << R"(,"status":)" << json_quote(to_string(node.status))
            << R"(,"priority":)" << node.priority << '}';
    }
    oss << R"(],"edges":[)";
    for (size_t i = 0; i < graph.edges.size(); ++i) {
        if (i > 0) oss << ',';
        oss << R"({"from":)" << json_quote(graph.edges[i].wire_id)
            << R"(,"to":)" << json_quote(graph.edges[i].depends_on) << '}';
    }
    oss << "]}";
    return oss.str();
}

// ─────────────────────────────────────────────
// Text
// ─────────────────────────────────────────────

std::string wire_table(const std::vector<WireWithDeps>& wires) {
    if (wires.empty()) return "No wires found.\n";

    std::ostringstream oss;
    for (const auto& entry : wires) {
        append_row(oss, entry.wire.status, entry.wire.id, entry.wire.title);

        auto blocking = blockers(entry.depends_on);
        if (!blocking.empty()) {
            oss << "  ← blocked by ";
            for (size_t i = 0; i < blocking.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << blocking[i];
            }
        }
        oss << '\n';
    }
    return oss.str();
}

std::string ready_table(const std::vector<Wire>& wires) {
    if (wires.empty()) return "No wires ready.\n";

    std::ostringstream oss;
    for (const auto& wire : wires) {
        append_row(oss, wire.status, wire.id, wire.title);
        oss << "  [pri:" << wire.priority << "]\n";
    }
    return oss.str();
}

std::string wire_detail_table(const WireWithDeps& detail) {
    const Wire& wire = detail.wire;
    std::ostringstream oss;
    append_row(oss, wire.status, wire.id, wire.title);
    oss << "  [pri:" << wire.priority << "]\n";

    if (wire.description) {
        oss << '\n' << *wire.description << '\n';
    }

    if (!detail.depends_on.empty()) {
        oss << "\nDepends on:\n";
        for (const auto& dep : detail.depends_on) {
            oss << "  ";
            append_row(oss, dep.status, dep.id, dep.title);
            oss << '\n';
        }
    }

    if (!detail.blocks.empty()) {
        oss << "\nBlocks:\n";
        for (const auto& blocked : detail.blocks) {
            oss << "  ";
            append_row(oss, blocked.status, blocked.id, blocked.title);
            oss << '\n';
        }
    }
    return oss.str();
}

std::string graph_dot(const GraphSnapshot& graph) {
    std::ostringstream oss;
    oss << "digraph wires {\n"
        << "  rankdir=LR;\n"
        << "  node [shape=box];\n";
    for (const auto& node : graph.nodes) {
        oss << "  " << json_quote(node.id)
            << " [label=\"" << json_escape(node.id) << "\\n" << json_escape(node.title) << '"'
            << ", tooltip=" << json_quote(to_string(node.status));
        if (node.status == Status::Done || node.status == Status::Cancelled) {
            oss << ", style=dashed";
        }
        oss << "];\n";
    }
    for (const auto& edge : graph.edges) {
        oss << "  " << json_quote(edge.wire_id) << " -> " << json_quote(edge.depends_on) << ";\n";
    }
    oss << "}\n";
    return oss.str();
}

// ─────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────

std::string error_json(const Error& error) {
    std::ostringstream oss;
    oss << R"({"error":)" << json_quote(error.message);
    if (error.code == ErrorCode::CircularDependency && !error.cycle.empty()) {
        oss << R"(,"cycle":[)";
        for (size_t i = 0; i < error.cycle.size(); ++i) {
            if (i > 0) oss << ',';
            oss << json_quote(error.cycle[i]);
        }
        oss << ']';
    }
    oss << '}';
    return oss.str();
}

std::string error_text(const Error& error) {
    return "error: " + error.message;
}

}  // namespace wires::cli
