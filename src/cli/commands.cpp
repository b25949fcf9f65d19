/**
 * @file commands.cpp
 * @brief Command dispatch: config, repository, logger, engine, output.
 */

#include "cli/commands.hpp"

#include "cli/output.hpp"
#include "core/config.hpp"
#include "core/json.hpp"
#include "core/logger.hpp"
#include "engine/wire_engine.hpp"
#include "policy/status_policy.hpp"
#include "repo/repository.hpp"
#include "telemetry/json_sink.hpp"

#include <memory>
#include <ostream>
#include <system_error>

namespace wires::cli {

namespace {

int report(const Error& error, CommandContext& ctx) {
    if (ctx.stderr_is_tty) {
        ctx.err << error_text(error) << '\n';
    } else {
        ctx.err << error_json(error) << '\n';
    }
    return 1;
}

/// Relative log paths are taken relative to the repository root.
std::unique_ptr<Logger> make_logger(const Config& config, bool verbose,
                                    const std::filesystem::path& root) {
    LogLevel level = log_level_from_string(config.logging.level).value_or(LogLevel::Warn);
    if (verbose) level = LogLevel::Debug;

    std::unique_ptr<ILogSink> sink;
    if (!config.logging.file.empty()) {
        auto file = config.logging.file.is_absolute() ? config.logging.file
                                                       : root / config.logging.file;
        sink = std::make_unique<JsonFileSink>(file.parent_path(), file.stem().string(),
                                              config.logging.max_file_size_kb,
                                              config.logging.rotate_count);
    } else {
        sink = std::make_unique<StderrSink>();
    }
    return std::make_unique<Logger>(std::move(sink), level);
}

int run_init(const Config& config, const CliArgs& args, CommandContext& ctx) {
    auto logger = make_logger(config, args.verbose, ctx.cwd);
    auto handle = init_repository(ctx.cwd, config);
    if (!handle) {
        logger->error(handle.error().message);
        return report(handle.error(), ctx);
    }
    logger->info("Initialized " + handle->db_path.string());
    ctx.out << R"({"status":"initialized","path":)" << json_quote(handle->db_path.string())
            << "}\n";
    return 0;
}

Result<TransitionOutcome> run_update(WireEngine& engine, const CliArgs& args) {
    WireUpdate change;
    change.title = args.title;
    change.description = args.description;
    change.priority = args.priority;
    if (args.status) {
        auto status = parse_status_label(*args.status);
        if (!status) return status.error();
        change.status = *status;
    }
    return engine.update(args.ids.at(0), change);
}

int dispatch(WireEngine& engine, const CliArgs& args, OutputFormat format, CommandContext& ctx) {
    auto& out = ctx.out;
    const bool table = format == OutputFormat::Table;

    switch (args.command) {
        case Command::New: {
            auto wire = engine.create(*args.title, args.description, args.priority.value_or(0));
            if (!wire) return report(wire.error(), ctx);
            out << created_json(*wire) << '\n';
            return 0;
        }
        case Command::List: {
            std::optional<Status> filter;
            if (args.status) {
                auto status = parse_status_label(*args.status);
                if (!status) return report(status.error(), ctx);
                filter = *status;
            }
            auto wires = engine.list(filter);
            if (!wires) return report(wires.error(), ctx);
            if (table) {
                out << wire_table(*wires);
            } else {
                out << wire_details_json(*wires) << '\n';
            }
            return 0;
        }
        case Command::Show: {
            auto wire = engine.get(args.ids.at(0));
            if (!wire) return report(wire.error(), ctx);
            if (table) {
                out << wire_detail_table(*wire);
            } else {
                out << wire_detail_json(*wire) << '\n';
            }
            return 0;
        }
        case Command::Update: {
            auto outcome = run_update(engine, args);
            if (!outcome) return report(outcome.error(), ctx);
            out << transition_json(*outcome, true) << '\n';
            return 0;
        }
        case Command::Start:
        case Command::Done:
        case Command::Cancel: {
            const auto& id = args.ids.at(0);
            auto outcome = args.command == Command::Start ? engine.start(id)
                         : args.command == Command::Done  ? engine.done(id)
                                                          : engine.cancel(id);
            if (!outcome) return report(outcome.error(), ctx);
            out << transition_json(*outcome, false) << '\n';
            return 0;
        }
        case Command::Dep: {
            auto added = engine.add_dependency(args.ids.at(0), args.ids.at(1));
            if (!added) return report(added.error(), ctx);
            out << edge_action_json(args.ids[0], args.ids[1], *added ? "added" : "unchanged")
                << '\n';
            return 0;
        }
        case Command::Undep: {
            auto removed = engine.remove_dependency(args.ids.at(0), args.ids.at(1));
            if (!removed) return report(removed.error(), ctx);
            out << edge_action_json(args.ids[0], args.ids[1], *removed ? "removed" : "unchanged")
                << '\n';
            return 0;
        }
        case Command::Ready: {
            auto wires = engine.ready();
            if (!wires) return report(wires.error(), ctx);
            if (table) {
                out << ready_table(*wires);
            } else {
                out << wires_json(*wires) << '\n';
            }
            return 0;
        }
        case Command::Rm: {
            const auto& id = args.ids.at(0);
            if (auto removed = engine.remove(id); !removed) return report(removed.error(), ctx);
            out << R"({"id":)" << json_quote(id) << R"(,"action":"deleted"})" << '\n';
            return 0;
        }
        case Command::Graph: {
            auto graph = engine.graph();
            if (!graph) return report(graph.error(), ctx);
            if (args.graph_format == GraphFormat::Dot) {
                out << graph_dot(*graph);
            } else {
                out << graph_json(*graph) << '\n';
            }
            return 0;
        }
        case Command::Help:
        case Command::Init:
            break;
    }
    return 0;
}

}  // namespace

int run_command(const CliArgs& args, CommandContext& ctx) {
    if (args.command == Command::Help) {
        ctx.out << usage();
        return 0;
    }

    // ── Configuration ────────────────────────
    Config config = default_config();
    if (args.config_path) {
        auto loaded = load_config(*args.config_path);
        if (!loaded) return report(loaded.error(), ctx);
        config = *loaded;
    }

    if (args.command == Command::Init) {
        return run_init(config, args, ctx);
    }

    // ── Repository ───────────────────────────
    auto handle = discover_repository(ctx.cwd, config.repository);
    if (!handle) return report(handle.error(), ctx);

    if (!args.config_path) {
        std::error_code ec;
        if (auto repo_config = config_path(*handle); std::filesystem::exists(repo_config, ec)) {
            auto loaded = load_config(repo_config);
            if (!loaded) return report(loaded.error(), ctx);
            config = *loaded;
        }
    }

    auto logger = make_logger(config, args.verbose, handle->root);

    // ── Engine ───────────────────────────────
    auto engine = WireEngine::open(*handle, config, *logger);
    if (!engine) return report(engine.error(), ctx);

    auto format = resolve_format(args.format, config.output.format, ctx.stdout_is_tty);
    int code = dispatch(**engine, args, format, ctx);
    logger->flush();
    return code;
}

}  // namespace wires::cli
