/**
 * @file main.cpp
 * @brief `wr` entry point.
 *
 * argv → CliArgs → run_command(). Everything past argument parsing lives
 * in src/cli/ so the integration tests can drive it in-process.
 */

#include "cli/commands.hpp"
#include "cli/options.hpp"
#include "cli/output.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

using namespace wires;

int main(int argc, char* argv[]) {
    std::vector<std::string> raw(argv + 1, argv + argc);

    const bool stderr_tty = cli::is_terminal(stderr);

    auto args = cli::parse_args(raw);
    if (!args) {
        if (stderr_tty) {
            std::cerr << cli::error_text(args.error()) << "\n\n" << cli::usage();
        } else {
            std::cerr << cli::error_json(args.error()) << '\n';
        }
        return 1;
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        Error error{ErrorCode::StoreFailure, "Cannot determine working directory: " + ec.message()};
        std::cerr << (stderr_tty ? cli::error_text(error) : cli::error_json(error)) << '\n';
        return 1;
    }

    cli::CommandContext ctx{cwd, std::cout, std::cerr, cli::is_terminal(stdout), stderr_tty};
    int code = cli::run_command(*args, ctx);
    std::cout.flush();
    return code;
}
