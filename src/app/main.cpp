/**
 * @file main.cpp
 * @brief LanBeacon daemon entry point.
 *
 * Wires all modules into the discovery pipeline:
 *   Config → Logger → Registry → Metadata → Engine → Sweeper → Query server
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "network/discovery_engine.hpp"
#include "network/query_server.hpp"
#include "protocol/authenticator.hpp"
#include "registry/expiry_sweeper.hpp"
#include "registry/host_registry.hpp"
#include "registry/hosts_file.hpp"
#include "sysinfo/metadata_source.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace lan_beacon;

namespace {

constexpr const char* VERSION = "1.0.0";

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║            LanBeacon v1.0.0               ║
  ║   Authenticated LAN Host Discovery and    ║
  ║   Liveness-Tracked Host Registry          ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "/etc/lanbeacon/lanbeacon.toml";
    std::string role;
    std::string log_dir;
    std::string log_level;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--role" && i + 1 < argc) {
            args.role = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--version") {
            std::cout << "lanbeacon " << VERSION << "\n";
            std::exit(0);
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: lanbeacon [OPTIONS]\n"
                      << "  --config <path>     Configuration file (default: /etc/lanbeacon/lanbeacon.toml)\n"
                      << "  --role <role>       announce | listen | both (overrides node.role)\n"
                      << "  --log-dir <path>    Log output directory (default: stdout)\n"
                      << "  --log-level <lvl>   debug | info | warn | error\n"
                      << "  --version           Print the version and exit\n"
                      << "  --help, -h          Show this help message\n";
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << " (see --help)\n";
            std::exit(1);
        }
    }
    return args;
}

EngineOptions engine_options(const Config& config, Role role, const MacAddress& local_mac) {
    EngineOptions options;
    options.role = role;
    options.port = config.node.port;
    options.target_mode = *parse_target_mode(config.node.target_mode);
    options.network_range = config.node.network_range;
    options.multicast_group = config.node.multicast_group;
    options.multicast_interface = config.node.multicast_interface;
    options.unicast_targets = config.node.unicast_targets;
    options.announce_interval = std::chrono::milliseconds(config.discovery.announce_interval_ms);
    options.timestamp_tolerance = std::chrono::seconds(config.discovery.timestamp_tolerance_s);
    options.rate_limit_per_minute = config.discovery.rate_limit_per_minute;
    options.worker_threads = config.discovery.worker_threads;
    options.max_pending = config.discovery.max_pending;
    options.max_datagram_bytes = config.discovery.max_datagram_bytes;
    options.local_mac = local_mac;
    return options;
}

void sync_hosts_file(HostsFileSync* hosts_file, HostRegistry& registry, Logger& logger) {
    if (!hosts_file) return;

    auto records = registry.get_all();
    if (!records) {
        logger.warn("Hosts file sync skipped: " + records.error().message);
        return;
    }
    if (auto synced = hosts_file->sync(*records); !synced) {
        logger.warn("Hosts file sync failed: " + synced.error().message);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.role.empty()) config.node.role = args.role;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "lanbeacon",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), parse_log_level(config.telemetry.log_level));
    logger.info("LanBeacon starting...");
    logger.info("Role: " + config.node.role + ", port " + std::to_string(config.node.port)
                + ", target mode " + config.node.target_mode);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Initialize Registry ──────────────────
    const auto& db_path = config.registry.db_path;
    if (db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            logger.error("Cannot create " + db_path.parent_path().string() + ": " + ec.message());
            return 1;
        }
    }

    auto registry_result = HostRegistry::open(db_path, &logger);
    if (!registry_result) {
        logger.error(registry_result.error().message);
        logger.flush();
        return 1;
    }
    auto registry = std::move(*registry_result);
    logger.info("Registry opened: " + db_path.string());

    // ── Detect Local Identity ────────────────
    LinuxMetadataSource metadata_source(config.node.network_range);
    auto local = metadata_source.read();
    if (!local) {
        logger.error("Local interface detection failed: " + local.error().message);
        logger.flush();
        return 1;
    }
    logger.info("Local host: " + local->hostname + " (" + local->mac_address + ", "
                + local->ip_address + ")");

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.metrics_file.empty()) {
        const auto& file = config.telemetry.metrics_file;
        auto dir = file.has_parent_path() ? file.parent_path() : std::filesystem::path{"."};
        metrics_sink = std::make_unique<JsonFileSink>(dir, file.stem().string(),
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    }
    DiscoveryMetrics metrics(std::move(metrics_sink));

    // ── Hosts File ───────────────────────────
    std::optional<HostsFileSync> hosts_file;
    if (config.hosts_file.enabled) {
        hosts_file.emplace(config.hosts_file.path);
        sync_hosts_file(&*hosts_file, *registry, logger);
        logger.info("Managing hosts file: " + config.hosts_file.path.string());
    }
    HostsFileSync* hosts_sync = hosts_file ? &*hosts_file : nullptr;

    // ── Initialize Discovery ─────────────────
    auto role = *parse_role(config.node.role);
    DiscoveryEngine engine(engine_options(config, role, local->mac_address),
                           Authenticator(config.security.shared_secret),
                           [&metadata_source] { return metadata_source.read(); },
                           *registry, logger, &metrics);

    if (hosts_sync) {
        engine.on_host_accepted([&](const HostRecord&) {
            sync_hosts_file(hosts_sync, *registry, logger);
        });
    }

    if (auto started = engine.start(); !started) {
        logger.error("Discovery engine failed to start: " + started.error().message);
        logger.flush();
        return 1;
    }

    // ── Expiry Sweeper ───────────────────────
    std::optional<ExpirySweeper> sweeper;
    if (role != Role::Announce) {
        sweeper.emplace(*registry, logger,
                        std::chrono::milliseconds(config.registry.expiry_interval_ms),
                        std::chrono::milliseconds(config.registry.stale_threshold_ms));
        sweeper->on_expired([&](const std::vector<HostRecord>& expired) {
            for (const auto& record : expired) metrics.record_expired(record);
            sync_hosts_file(hosts_sync, *registry, logger);
        });
        sweeper->start();
        logger.info("Expiry sweeper started (interval "
                    + std::to_string(config.registry.expiry_interval_ms) + "ms, threshold "
                    + std::to_string(config.registry.stale_threshold_ms) + "ms)");
    }

    // ── Query Server ─────────────────────────
    QueryServer query_server(*registry, logger);
    if (auto listening = query_server.listen(config.query.socket_path); listening) {
        query_server.serve();
    } else {
        logger.warn("Could not start query server: " + listening.error().message);
    }

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            auto active = registry->get_active();
            logger.info("Status: " + std::string(active ? std::to_string(active->size()) : "?")
                        + " active hosts; " + metrics.status_line());
            metrics.flush();
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    query_server.stop();
    if (sweeper) sweeper->stop();
    engine.stop();
    metrics.flush();

    logger.info("LanBeacon stopped.");
    logger.flush();
    return 0;
}
