/**
 * @file wfsync_cli.cpp
 * @brief Command-line driver: one-shot sync commands and a watch mode
 *
 * USAGE:
 *   wfsync [--config <file>] [--dir <path>] [--host <url>] [--poll <ms>] [-v] <command>
 *
 * COMMANDS:
 *   status                          print the status matrix
 *   pull [--force] [file]           pull one workflow or every pullable one
 *   push [--force] [file]           push one workflow or every pushable one
 *   sync                            pull everything, then push everything
 *   watch                           observe both sides and auto-sync until Ctrl+C
 *   resolve <file> --keep-local|--keep-remote
 *   delete <file>                   delete remotely (archived first) and forget it
 *   restore <file>                  bring back the newest archived copy
 */

#include "wfsync/config/config.hpp"
#include "wfsync/events/components.hpp"
#include "wfsync/events/event_bus.hpp"
#include "wfsync/remote/n8n_client.hpp"
#include "wfsync/sync/auto_sync.hpp"
#include "wfsync/sync/engine.hpp"
#include "wfsync/sync/watcher.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using wfsync::Error;
using wfsync::Result;
using wfsync::config::SyncConfig;
using wfsync::sync::BatchReport;
using wfsync::sync::ConflictStrategy;
using wfsync::sync::SyncEngine;
using wfsync::sync::Watcher;
using wfsync::workflow::SyncStatusUtils;
using wfsync::workflow::WorkflowRef;

namespace fs = std::filesystem;

namespace {

struct CommandLine {
    std::optional<fs::path> config_path;
    std::optional<std::string> dir;
    std::optional<std::string> host;
    std::optional<long> poll_ms;
    bool verbose = false;
    bool force = false;
    std::optional<ConflictStrategy> strategy;
    std::vector<std::string> positional;
};

void print_usage() {
    std::cout << "Usage: wfsync [options] <command> [args]\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>   configuration file (default: ./wfsync.json)\n"
              << "  --dir <path>      sync directory\n"
              << "  --host <url>      n8n instance URL\n"
              << "  --poll <ms>       remote poll interval for watch\n"
              << "  -v, --verbose     debug logging\n"
              << "\n"
              << "Commands:\n"
              << "  status\n"
              << "  pull [--force] [file]\n"
              << "  push [--force] [file]\n"
              << "  sync\n"
              << "  watch\n"
              << "  resolve <file> --keep-local|--keep-remote\n"
              << "  delete <file>\n"
              << "  restore <file>\n";
}

std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            cli.config_path = fs::path(argv[++i]);
        } else if (arg == "--dir" && has_value) {
            cli.dir = argv[++i];
        } else if (arg == "--host" && has_value) {
            cli.host = argv[++i];
        } else if (arg == "--poll" && has_value) {
            try {
                cli.poll_ms = std::stol(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "--poll expects a number of milliseconds\n";
                return std::nullopt;
            }
        } else if (arg == "-v" || arg == "--verbose") {
            cli.verbose = true;
        } else if (arg == "--force" || arg == "-f") {
            cli.force = true;
        } else if (arg == "--keep-local") {
            cli.strategy = ConflictStrategy::KeepLocal;
        } else if (arg == "--keep-remote") {
            cli.strategy = ConflictStrategy::KeepRemote;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else {
            cli.positional.push_back(arg);
        }
    }

    if (cli.positional.empty()) {
        return std::nullopt;
    }
    return cli;
}

void apply_flags(SyncConfig& config, const CommandLine& cli) {
    if (cli.dir) config.directory = *cli.dir;
    if (cli.host) config.host = *cli.host;
    if (cli.poll_ms && *cli.poll_ms > 0) config.poll_interval = std::chrono::milliseconds(*cli.poll_ms);
    if (cli.verbose) config.log_level = "debug";
}

void print_status(const Watcher& watcher) {
    const auto matrix = watcher.status_matrix();
    if (matrix.empty()) {
        std::cout << "No workflows in " << watcher.directory().string() << " or on the remote.\n";
        return;
    }

    std::cout << std::left << std::setw(22) << "STATUS" << std::setw(20) << "ID" << "FILE\n";
    for (const auto& snap : matrix) {
        std::cout << std::left << std::setw(22) << SyncStatusUtils::to_string(snap.status)
                  << std::setw(20) << snap.workflow_id.value_or("-") << snap.filename << "\n";
    }
}

int report_batch(const char* label, const BatchReport& report) {
    for (const auto& item : report.done) {
        std::cout << "  " << label << " " << item.filename << " (" << item.detail << ")\n";
    }
    for (const auto& item : report.skipped) {
        std::cout << "  skipped " << item.filename << ": " << item.detail << "\n";
    }
    for (const auto& item : report.failed) {
        std::cerr << "  failed " << item.filename << ": " << item.detail << "\n";
    }
    return report.ok() ? 0 : 1;
}

template<typename T>
int finish(const Result<T>& result, const std::string& success) {
    if (result.is_error()) {
        const Error& error = result.error();
        std::cerr << "Error [" << wfsync::error_code_name(error.code) << "]: " << error.message << "\n";
        return 1;
    }
    std::cout << success << "\n";
    return 0;
}

std::optional<std::string> require_id(const Watcher& watcher, const std::string& filename) {
    auto id = watcher.id_for_filename(filename);
    if (!id) {
        std::cerr << "No workflow id is known for " << filename << "\n";
    }
    return id;
}

int run_watch(boost::asio::io_context& io, Watcher& watcher) {
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down...", signal);
        watcher.stop();
        io.stop();
    });

    spdlog::info("Watching {} (Ctrl+C to stop)", watcher.directory().string());
    io.run();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto cli = parse_command_line(argc, argv);
    if (!cli) {
        print_usage();
        return 1;
    }

    auto loaded = wfsync::config::load_config(cli->config_path);
    if (loaded.is_error()) {
        std::cerr << "Configuration error: " << loaded.error().message << "\n";
        return 1;
    }
    SyncConfig config = loaded.value();
    apply_flags(config, *cli);
    spdlog::set_level(config.spdlog_level());

    auto valid = wfsync::config::validate_remote(config);
    if (valid.is_error()) {
        std::cerr << "Configuration error: " << valid.error().message << "\n";
        return 1;
    }

    auto client = wfsync::remote::N8nClient::connect(config.host, config.api_key);
    if (client.is_error()) {
        std::cerr << "Cannot reach " << config.host << ": " << client.error().message << "\n";
        return 1;
    }
    auto connected = client.value()->test_connection();
    if (connected.is_error()) {
        std::cerr << "Cannot reach " << config.host << ": " << connected.error().message << "\n";
        return 1;
    }

    const std::string command = cli->positional.front();
    const std::string target = cli->positional.size() > 1 ? cli->positional[1] : std::string{};
    const bool watching = command == "watch";

    boost::asio::io_context io;
    wfsync::events::EventBus bus;
    wfsync::events::LoggerComponent logger(bus);
    wfsync::events::StatusBoard board(bus);

    auto options = config.watcher_options();
    options.watch_filesystem = watching;
    if (!watching) {
        options.poll_interval = std::chrono::milliseconds(0);
    }

    Watcher watcher(io, *client.value(), bus, options);
    SyncEngine engine(*client.value(), watcher, bus);

    // Subscribed before start() so the initial broadcast is acted upon
    wfsync::sync::AutoSyncDriver driver(engine, bus, {true, true});
    if (watching) {
        driver.start();
    }

    auto started = watcher.start();
    if (started.is_error()) {
        std::cerr << "Cannot start: " << started.error().message << "\n";
        return 1;
    }

    int exit_code = 0;

    if (command == "status") {
        print_status(watcher);
    } else if (command == "pull" || command == "push") {
        const bool pulling = command == "pull";
        if (target.empty()) {
            exit_code = report_batch(pulling ? "pulled" : "pushed", pulling ? engine.pull_all() : engine.push_all());
        } else if (cli->force) {
            if (auto id = require_id(watcher, target)) {
                exit_code = pulling ? finish(engine.force_pull(*id), "Force-pulled " + target)
                                    : finish(engine.force_push(*id), "Force-pushed " + target);
            } else {
                exit_code = 1;
            }
        } else {
            WorkflowRef ref{target, watcher.id_for_filename(target)};
            exit_code = pulling ? finish(engine.pull(ref), "Pulled " + target)
                                : finish(engine.push(ref), "Pushed " + target);
        }
    } else if (command == "sync") {
        const int pulled = report_batch("pulled", engine.pull_all());
        const int pushed = report_batch("pushed", engine.push_all());
        exit_code = pulled | pushed;
    } else if (command == "watch") {
        exit_code = run_watch(io, watcher);
        driver.stop();
    } else if (command == "resolve") {
        if (target.empty() || !cli->strategy) {
            std::cerr << "resolve needs a file and --keep-local or --keep-remote\n";
            exit_code = 1;
        } else {
            WorkflowRef ref{target, watcher.id_for_filename(target)};
            exit_code = finish(engine.resolve_conflict(ref, *cli->strategy), "Resolved " + target);
        }
    } else if (command == "delete") {
        if (auto id = target.empty() ? std::optional<std::string>{} : require_id(watcher, target)) {
            auto deleted = engine.delete_remote(*id);
            exit_code = deleted.is_ok() ? finish(engine.finalize_deletion(*id), "Deleted " + target)
                                        : finish(deleted, "");
        } else {
            exit_code = 1;
        }
    } else if (command == "restore") {
        if (target.empty()) {
            std::cerr << "restore needs a file\n";
            exit_code = 1;
        } else {
            auto restored = engine.restore_from_archive(target);
            exit_code = finish(restored, "Restored " + target + " from " + restored.value_or("?"));
        }
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        exit_code = 1;
    }

    watcher.stop();
    if (command != "status") {
        board.print_summary();
    }
    return exit_code;
}
