/**
 * hashfleetd - Work-distribution coordinator for password-recovery agents
 *
 * Usage:
 *   hashfleetd [options]
 *
 * Options:
 *   --config, -c     Config file (default: ./hashfleet.yml, ~/.hashfleet/config.yml)
 *   --state, -s      Snapshot file for persisted state
 *   --log-dir        Log directory (default: ~/.hashfleet)
 *   --script         Run console commands from a file, then exit
 *   --serve          No console; run the sweeper until interrupted
 *   --no-color       Plain console output
 *   --debug          Debug logging
 *   --version        Print version and exit
 *   --help, -h       Show this help message
 */

#include "core/logger.hpp"
#include "core/version.hpp"
#include "core/yaml_config.hpp"
#include "fleet/coordinator.hpp"
#include "fleet/sweeper.hpp"
#include "services/events.hpp"
#include "services/resources.hpp"
#include "store/snapshot_backend.hpp"
#include "store/store.hpp"
#include "ui/console.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#ifndef _WIN32
#include <unistd.h>
#endif

using namespace hashfleet;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown = true;
}

/**
 * Command-line arguments.
 */
struct Arguments {
    std::string config_file;          // Explicit config path
    std::string state_file;           // Overrides paths.state_file
    std::string log_dir;              // Overrides paths.log_dir
    std::string script;               // Console script to execute
    bool serve = false;
    bool color = true;
    bool debug = false;
    bool version = false;
    bool help = false;
    bool invalid = false;
};

/**
 * Parse command-line arguments.
 */
Arguments parse_args(int argc, char* argv[]) {
    Arguments args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--version") {
            args.version = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.config_file = argv[++i];
        } else if ((arg == "--state" || arg == "-s") && i + 1 < argc) {
            args.state_file = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--script" && i + 1 < argc) {
            args.script = argv[++i];
        } else if (arg == "--serve") {
            args.serve = true;
        } else if (arg == "--no-color") {
            args.color = false;
        } else if (arg == "--debug") {
            args.debug = true;
        } else {
            std::cerr << "[!] Unknown option: " << arg << "\n";
            args.invalid = true;
        }
    }

    return args;
}

/**
 * Print usage information.
 */
void print_usage() {
    std::cout << "\n";
    std::cout << "hashfleetd " << HASHFLEET_VERSION << "\n";
    std::cout << "==================\n\n";
    std::cout << "Distributes password-recovery work across a fleet of agents.\n\n";
    std::cout << "Usage:\n";
    std::cout << "  hashfleetd [options]\n\n";
    std::cout << R"(Options:
  --config, -c <file>     Config file (default: ./hashfleet.yml)
  --state, -s <file>      Snapshot file for persisted state
  --log-dir <dir>         Log directory (default: ~/.hashfleet)
  --script <file>         Run console commands from a file, then exit
  --serve                 No console; run background maintenance until interrupted
  --no-color              Plain console output
  --debug                 Debug logging
  --version               Print version and exit
  --help, -h              Show this help message

Examples:
  hashfleetd --state /var/lib/hashfleet/state.snap
  hashfleetd --script bootstrap.txt --no-color
)";
}

int main(int argc, char* argv[]) {
    Arguments args = parse_args(argc, argv);

    if (args.help || args.invalid) {
        print_usage();
        return args.invalid ? 2 : 0;
    }
    if (args.version) {
        std::cout << HASHFLEET_NAME << " " << HASHFLEET_VERSION << "\n";
        return 0;
    }

    // Config file first, command line wins
    CoordinatorConfig config;
    if (!config.load(args.config_file) && !args.config_file.empty()) {
        return 1;
    }
    if (!args.state_file.empty()) config.state_file = args.state_file;
    if (!args.log_dir.empty()) config.log_dir = args.log_dir;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    auto& logger = Logger::instance();
    if (!logger.init(config.log_dir)) {
        std::cerr << "[!] Could not open log directory, continuing without a log file\n";
    } else {
        std::cout << "[*] Logging to " << logger.path() << "\n";
    }
    logger.set_min_level(args.debug ? Logger::Level::DEBUG : Logger::Level::INFO);
    LOG_INFO(std::string("Starting ") + HASHFLEET_NAME + " v" + HASHFLEET_VERSION +
             (config.loaded_from.empty() ? "" : " (config " + config.loaded_from + ")"));

    SystemClock clock;
    LogEventSink events;
    store::Store store(clock, &events);

    if (!config.state_file.empty()) {
        store.set_backend(std::make_unique<store::SnapshotBackend>(config.state_file));
        std::error_code ec;
        if (std::filesystem::exists(config.state_file, ec)) {
            Status loaded = store.load();
            if (!loaded) {
                std::cerr << "[!] Refusing to start: " << loaded.error().describe() << "\n";
                LOG_FATAL("State load failed: " + loaded.error().describe());
                return 1;
            }
            LOG_INFO("State loaded from " + config.state_file);
        }
    }

    std::unique_ptr<SignedResourceResolver> resolver;
    if (!config.signing_secret.empty()) {
        resolver = std::make_unique<SignedResourceResolver>(config.resource_base_url, config.signing_secret,
                                                            config.handle_ttl_seconds);
    } else {
        LOG_WARN("No resources.signing_secret configured; assignments carry no fetch handles");
    }

    Coordinator coordinator(store, config, resolver.get());
    Sweeper sweeper(coordinator, std::chrono::seconds(config.sweep_interval_seconds));
    sweeper.start();

    int failures = 0;
    if (args.serve) {
        std::cout << "[*] " << HASHFLEET_NAME << " serving, Ctrl+C to stop\n";
        while (!g_shutdown) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    } else if (!args.script.empty()) {
        std::ifstream script(args.script);
        if (!script.is_open()) {
            std::cerr << "[!] Cannot open script: " << args.script << "\n";
            failures = 1;
        } else {
            ui::Console console(coordinator, std::cout, false);
            failures = console.run(script, g_shutdown, false);
        }
    } else {
        bool interactive = false;
#ifndef _WIN32
        interactive = isatty(STDIN_FILENO) != 0;
#endif
        ui::Console console(coordinator, std::cout, args.color && interactive);
        failures = console.run(std::cin, g_shutdown, interactive);
    }

    if (g_shutdown) {
        std::cout << "\n[!] Interrupt received, shutting down...\n";
        LOG_INFO("Shutdown requested by signal");
    }

    sweeper.stop();
    Status flushed = store.flush();
    if (!flushed) {
        std::cerr << "[!] Final flush failed: " << flushed.error().describe() << "\n";
    }
    LOG_INFO("Stopped");

    return (failures > 0 || !flushed) ? 1 : 0;
}
