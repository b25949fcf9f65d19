/**
 * @file commands.hpp
 * @brief Execution of parsed `wr` invocations.
 */

#pragma once

#include "cli/options.hpp"

#include <filesystem>
#include <iosfwd>

namespace wires::cli {

/**
 * @brief Process-level inputs of a command, injectable for tests.
 */
struct CommandContext {
    std::filesystem::path cwd;      ///< Start of repository discovery; init target
    std::ostream& out;
    std::ostream& err;
    bool stdout_is_tty = false;
    bool stderr_is_tty = false;
};

/**
 * @brief Run one command.
 *
 * Results go to `ctx.out`, errors to `ctx.err` (JSON unless stderr is a
 * terminal). Log records go to stderr or the configured log file.
 *
 * @return Process exit code: 0 on success, 1 on any failure.
 */
int run_command(const CliArgs& args, CommandContext& ctx);

}  // namespace wires::cli
