/**
 * @file main.cpp
 * @brief dsync command line: deploy a local directory to a remote host over SSH
 *
 * USAGE:
 *   dsync [local_path] [remote_path] [-c FILE] [-v] [--delete | --no-delete]
 *
 * Exit codes: 0 success, 1 deployment failed, 2 usage or configuration error.
 */

#include "dsync/cli/logging.hpp"
#include "dsync/config/job_loader.hpp"
#include "dsync/events/components.hpp"
#include "dsync/net/ssh_transport.hpp"
#include "dsync/sync/orchestrator.hpp"
#include "dsync/sync/progress_monitor.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

// Global token for signal handling; cancel() is a single atomic store
const dsync::CancellationToken* g_cancel = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT && g_cancel != nullptr) {
        g_cancel->cancel();
    }
}

struct Arguments {
    dsync::config::CliOverrides overrides;
    std::optional<std::filesystem::path> config_path;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name
              << " [local_path] [remote_path] [-c FILE] [-v] [--delete | --no-delete]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE   Job file (default: dev.config.yml, dev.config.json,\n"
                 "                      config.yml, then config.json)\n";
    std::cout << "  -v, --verbose       Debug logging\n";
    std::cout << "  --delete            Remove the remote directory before deploying\n";
    std::cout << "  --no-delete         Keep the remote directory (overrides the job file)\n";
    std::cout << "  -h, --help          Show this help\n";
}

std::optional<Arguments> parse_arguments(int argc, char* argv[]) {
    Arguments args;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--delete") {
            args.overrides.delete_before_sync = true;
        } else if (arg == "--no-delete") {
            args.overrides.delete_before_sync = false;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            args.config_path = std::filesystem::path(argv[++i]);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else if (positional == 0) {
            args.overrides.local_path = std::filesystem::path(arg);
            ++positional;
        } else if (positional == 1) {
            args.overrides.remote_path = arg;
            ++positional;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    return args;
}

void print_summary(const dsync::sync::SyncJob& job, const dsync::sync::SyncResult& result) {
    spdlog::info("═══════════════════════════════════════");
    if (result.ok()) {
        spdlog::info("Deployment succeeded: {} -> {}:{}",
                     job.local_root.string(), job.connection.hostname, job.remote_root);
        spdlog::info("  Bytes transferred: {}", result.bytes_transferred);
        spdlog::info("  Checksum verified: {}", result.verified ? "yes" : "no");
    } else {
        spdlog::error("Deployment failed at stage {}",
                      result.failure_stage ? dsync::sync::to_string(*result.failure_stage) : "unknown");
        if (result.error) {
            spdlog::error("  {}", result.error->describe());
        }
    }
    spdlog::info("  Duration: {}ms", result.duration.count());
    spdlog::info("═══════════════════════════════════════");
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

    auto args = parse_arguments(argc, argv);
    if (!args) {
        print_usage(argv[0]);
        return kExitUsage;
    }
    if (args->help) {
        print_usage(argv[0]);
        return kExitSuccess;
    }

    std::error_code ec;
    const auto working_dir = std::filesystem::current_path(ec);
    if (ec) {
        spdlog::error("Cannot determine working directory: {}", ec.message());
        return kExitUsage;
    }

    auto config_path = dsync::config::resolve_config_path(args->config_path, working_dir);
    if (config_path.is_error()) {
        spdlog::error("{}", config_path.error().describe());
        return kExitUsage;
    }

    auto loaded = dsync::config::load_job_file(config_path.value(), args->overrides);
    if (loaded.is_error()) {
        spdlog::error("{}", loaded.error().describe());
        return kExitUsage;
    }
    const auto& job = loaded.value().job;

    auto logging = dsync::cli::configure_logging(loaded.value().logging, args->verbose);
    if (logging.is_error()) {
        spdlog::error("{}", logging.error().describe());
        return kExitUsage;
    }
    spdlog::info("Loaded configuration from {}", loaded.value().source.string());

    dsync::events::EventBus bus;
    dsync::events::LoggerComponent logger(bus);
    dsync::events::MetricsComponent metrics(bus);
    dsync::sync::ProgressMonitor progress(bus);

    dsync::sync::SyncOrchestrator orchestrator(
        dsync::net::make_ssh_transport_factory(job.connection, job.options.chunk_size), bus);

    g_cancel = &orchestrator.cancellation_token();
    std::signal(SIGINT, signal_handler);

    spdlog::info("Starting deployment: {} -> {}", job.local_root.string(), job.remote_root);
    const auto result = orchestrator.run(job);

    std::signal(SIGINT, SIG_DFL);
    g_cancel = nullptr;

    progress.stop();
    print_summary(job, result);
    metrics.print_stats();

    return result.ok() ? kExitSuccess : kExitFailed;
}
