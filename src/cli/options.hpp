/**
 * @file options.hpp
 * @brief Command-line parsing for `wr`.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wires::cli {

enum class OutputFormat : uint8_t {
    Json,
    Table
};

enum class GraphFormat : uint8_t {
    Json,
    Dot
};

enum class Command : uint8_t {
    Help,
    Init,
    New,
    List,
    Show,
    Update,
    Start,
    Done,
    Cancel,
    Dep,
    Undep,
    Ready,
    Rm,
    Graph
};

/**
 * @brief Parsed invocation.
 *
 * Status labels are kept as typed by the user and validated by the
 * command, so a bad label is reported as InvalidStatusValue.
 */
struct CliArgs {
    // Global options, accepted before or after the command word.
    std::optional<std::filesystem::path> config_path;
    std::optional<OutputFormat> format;
    bool verbose = false;

    Command command = Command::Help;
    std::vector<std::string> ids;               ///< Positional wire ids

    std::optional<std::string> title;           ///< new (positional), update --title
    std::optional<std::string> description;     ///< -d / --description
    std::optional<std::string> status;          ///< list -s, update --status
    std::optional<Priority> priority;           ///< -p / --priority
    GraphFormat graph_format = GraphFormat::Json;
};

/**
 * @brief Parse argv[1..].
 *
 * Fails with InvalidArgument on an unknown command or option, a missing
 * option value, a malformed number, or the wrong number of positionals.
 */
Result<CliArgs> parse_args(const std::vector<std::string>& args);

[[nodiscard]] std::string usage();

}  // namespace wires::cli
