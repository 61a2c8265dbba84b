/**
 * @file main.cpp
 * @brief beaconfig command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Resolve mode (default):
 *   Config → Logger → ClientStack → ConfigFacade::resolve → mapping JSON on stdout
 * Announce mode (--announce <url>):
 *   Config → Logger → BeaconAnnouncer, until SIGINT/SIGTERM
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "facade/client_stack.hpp"
#include "network/beacon_announcer.hpp"
#include "telemetry/json_sink.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace beaconfig;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr int EXIT_RESOLVE_FAILED = 1;
constexpr int EXIT_BAD_CONFIG = 2;
constexpr int EXIT_CANCELLED = 130;

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool config_given = false;
    std::string group;
    bool bypass_cache = false;
    std::string log_dir;
    std::string log_level;
    std::string announce_url;
    std::string announce_target;
    std::optional<uint32_t> announce_interval_ms;
};

void print_usage() {
    std::cout << "Usage: beaconfig [OPTIONS]\n"
              << "  --config <path>          Configuration file (default: config/default.toml)\n"
              << "  --group <key>            Configuration group to print (dotted path; default: all)\n"
              << "  --bypass-cache           Force a fresh discovery and claim\n"
              << "  --log-dir <path>         Write NDJSON logs to this directory (default: stderr)\n"
              << "  --log-level <level>      debug | info | warn | error\n"
              << "  --announce <url>         Broadcast beacons for <url> instead of resolving\n"
              << "  --target <address>       Announce destination (default: 255.255.255.255)\n"
              << "  --interval-ms <ms>       Announce interval (default: 1000)\n"
              << "  --help, -h               Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
            args.config_given = true;
        } else if (arg == "--group" && i + 1 < argc) {
            args.group = argv[++i];
        } else if (arg == "--bypass-cache") {
            args.bypass_cache = true;
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--announce" && i + 1 < argc) {
            args.announce_url = argv[++i];
        } else if (arg == "--target" && i + 1 < argc) {
            args.announce_target = argv[++i];
        } else if (arg == "--interval-ms" && i + 1 < argc) {
            try {
                args.announce_interval_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid --interval-ms value: " << argv[i] << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage();
            return std::nullopt;
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_sink(const TelemetryConfig& telemetry) {
    if (!telemetry.log_dir.empty()) {
        return std::make_unique<JsonFileSink>(telemetry.log_dir, "beaconfig",
                                              telemetry.max_file_size_mb,
                                              telemetry.rotate_count);
    }
    return std::make_unique<StderrSink>();
}

/**
 * @brief Broadcast beacons until a shutdown signal arrives.
 */
int run_announce(const Config& config, const CLIArgs& args, Logger& logger) {
    AnnouncerOptions options;
    options.port = config.discovery.broadcast_port;
    options.magic_phrase = config.discovery.magic_phrase;
    if (!args.announce_target.empty()) options.target_address = args.announce_target;
    if (args.announce_interval_ms) options.interval_ms = *args.announce_interval_ms;

    BeaconAnnouncer announcer(Beacon{args.announce_url}, options, logger);
    if (auto started = announcer.start(); !started) {
        logger.error("app", "Could not start announcer: " + started.error().describe());
        return EXIT_RESOLVE_FAILED;
    }

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    announcer.stop();
    logger.info("app", "Announcer stopped after " + std::to_string(announcer.sent_count())
                + " beacon(s)");
    return 0;
}

/**
 * @brief Resolve one group on a worker thread; signals cancel it.
 */
int run_resolve(const Config& config, const CLIArgs& args, Logger& logger) {
    auto prompt = [](const std::string& verification_url, const std::string& /*device_code*/) {
        std::cerr << "Authorize this client by visiting:\n  " << verification_url << std::endl;
    };

    auto stack = ClientStack::create(config, logger, nullptr, prompt);
    if (!stack) {
        std::cerr << "Failed to build client: " << stack.error().describe() << std::endl;
        return EXIT_BAD_CONFIG;
    }
    auto& facade = (*stack)->facade();

    std::optional<Result<ConfigMapping>> outcome;
    std::atomic<bool> done{false};

    std::jthread worker([&](std::stop_token stop) {
        outcome.emplace(facade.resolve(args.group, args.bypass_cache, stop));
        done.store(true);
    });

    while (!done.load()) {
        if (g_shutdown_requested && !worker.get_stop_token().stop_requested()) {
            logger.info("app", "Shutdown requested, cancelling resolve");
            worker.request_stop();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    worker.join();

    const auto& result = *outcome;
    if (!result) {
        std::cerr << "Resolve failed: " << result.error().describe() << std::endl;
        return result.error().code == ErrorCode::Cancelled ? EXIT_CANCELLED : EXIT_RESOLVE_FAILED;
    }

    nlohmann::json out(*result);
    std::cout << out.dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) return EXIT_BAD_CONFIG;

    // Load configuration
    Config config = default_config();
    if (args->config_given || std::filesystem::exists(args->config_path)) {
        auto config_result = load_config(args->config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().describe() << std::endl;
            return EXIT_BAD_CONFIG;
        }
        config = *config_result;
    }

    // Apply CLI overrides
    if (!args->log_dir.empty()) config.telemetry.log_dir = args->log_dir;
    if (!args->log_level.empty()) config.telemetry.log_level = args->log_level;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << config.telemetry.log_level << std::endl;
        return EXIT_BAD_CONFIG;
    }

    // ── Initialize Logger ────────────────────
    Logger logger(make_sink(config.telemetry), *level);
    logger.info("app", "beaconfig starting (discovery " + config.discovery.mode
                + ", demander " + config.grant.demander + ")");

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int rc = args->announce_url.empty()
        ? run_resolve(config, *args, logger)
        : run_announce(config, *args, logger);

    logger.flush();
    return rc;
}
