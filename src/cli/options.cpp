/**
 * @file options.cpp
 * @brief Hand-rolled argument parser for `wr`.
 */

#include "cli/options.hpp"

#include <charconv>
#include <limits>
#include <string_view>
#include <utility>

namespace wires::cli {

namespace {

struct CommandSpec {
    std::string_view name;
    Command command;
    size_t positionals;     ///< Required positional arguments
};

constexpr CommandSpec kCommands[] = {
    {"init",   Command::Init,   0},
    {"new",    Command::New,    1},
    {"list",   Command::List,   0},
    {"show",   Command::Show,   1},
    {"update", Command::Update, 1},
    {"start",  Command::Start,  1},
    {"done",   Command::Done,   1},
    {"cancel", Command::Cancel, 1},
    {"dep",    Command::Dep,    2},
    {"undep",  Command::Undep,  2},
    {"ready",  Command::Ready,  0},
    {"rm",     Command::Rm,     1},
    {"graph",  Command::Graph,  0},
    {"help",   Command::Help,   0},
};

Error bad_usage(std::string message) {
    return Error{ErrorCode::InvalidArgument, std::move(message)};
}

Result<Priority> parse_priority(const std::string& text) {
    int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last
        || value < std::numeric_limits<Priority>::min()
        || value > std::numeric_limits<Priority>::max()) {
        return bad_usage("Invalid priority: " + text);
    }
    return static_cast<Priority>(value);
}

}  // namespace

Result<CliArgs> parse_args(const std::vector<std::string>& args) {
    CliArgs parsed;
    std::optional<CommandSpec> spec;
    std::vector<std::string> positionals;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto next_value = [&](std::string_view option) -> Result<std::string> {
            if (i + 1 >= args.size()) {
                return bad_usage("Missing value for " + std::string{option});
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            parsed.command = Command::Help;
            return parsed;
        }
        if (arg == "--verbose" || arg == "-v") {
            parsed.verbose = true;
        } else if (arg == "--config") {
            auto value = next_value(arg);
            if (!value) return value.error();
            parsed.config_path = std::filesystem::path{*value};
        } else if (arg == "--format") {
            auto value = next_value(arg);
            if (!value) return value.error();
            // After `graph`, --format selects the export syntax.
            if (spec && spec->command == Command::Graph) {
                if (*value == "json") {
                    parsed.graph_format = GraphFormat::Json;
                } else if (*value == "dot") {
                    parsed.graph_format = GraphFormat::Dot;
                } else {
                    return bad_usage("Unknown graph format: " + *value);
                }
            } else if (*value == "json") {
                parsed.format = OutputFormat::Json;
            } else if (*value == "table") {
                parsed.format = OutputFormat::Table;
            } else {
                return bad_usage("Unknown output format: " + *value);
            }
        } else if (spec && (arg == "-d" || arg == "--description")) {
            auto value = next_value(arg);
            if (!value) return value.error();
            parsed.description = std::move(*value);
        } else if (spec && (arg == "-p" || arg == "--priority")) {
            auto value = next_value(arg);
            if (!value) return value.error();
            auto priority = parse_priority(*value);
            if (!priority) return priority.error();
            parsed.priority = *priority;
        } else if (spec && (arg == "-s" || arg == "--status")) {
            auto value = next_value(arg);
            if (!value) return value.error();
            parsed.status = std::move(*value);
        } else if (spec && arg == "--title") {
            auto value = next_value(arg);
            if (!value) return value.error();
            parsed.title = std::move(*value);
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "--") {
            return bad_usage("Unknown option: " + arg);
        } else if (!spec) {
            for (const auto& candidate : kCommands) {
                if (candidate.name == arg) {
                    spec = candidate;
                    break;
                }
            }
            if (!spec) return bad_usage("Unknown command: " + arg);
            parsed.command = spec->command;
        } else {
            positionals.push_back(arg);
        }
    }

    if (!spec) {
        return parsed;
    }
    if (positionals.size() != spec->positionals) {
        return bad_usage("'" + std::string{spec->name} + "' expects "
                         + std::to_string(spec->positionals) + " argument(s), got "
                         + std::to_string(positionals.size()));
    }

    if (spec->command == Command::New) {
        parsed.title = std::move(positionals.front());
    } else {
        parsed.ids = std::move(positionals);
    }
    return parsed;
}

std::string usage() {
    return
        "Usage: wr [--config PATH] [--format json|table] [--verbose] <command>\n"
        "\n"
        "Commands:\n"
        "  init                                Initialize a wires repository here\n"
        "  new <title> [-d DESC] [-p N]        Create a wire\n"
        "  list [-s STATUS]                    List wires\n"
        "  show <id>                           Show a wire with its dependencies\n"
        "  update <id> [--title T] [--description D] [--status S] [--priority N]\n"
        "  start <id>                          Set status to IN_PROGRESS\n"
        "  done <id>                           Set status to DONE\n"
        "  cancel <id>                         Set status to CANCELLED\n"
        "  dep <id> <depends_on>               Add a dependency\n"
        "  undep <id> <depends_on>             Remove a dependency\n"
        "  ready                               Wires that can be worked on now\n"
        "  rm <id>                             Delete a wire and its edges\n"
        "  graph [--format json|dot]           Export the dependency graph\n";
}

}  // namespace wires::cli
