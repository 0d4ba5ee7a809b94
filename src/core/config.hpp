/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace lan_beacon {

inline constexpr const char* PLACEHOLDER_SECRET = "CHANGE_ME";

struct NodeConfig {
    std::string role = "both";                  ///< "announce", "listen", "both"
    std::string network_range;                  ///< CIDR, e.g. "192.168.1.0/24"
    uint16_t port = 5678;
    std::string target_mode = "broadcast";      ///< "broadcast", "multicast", "unicast"
    std::string multicast_group = "239.255.0.1";
    std::string multicast_interface;            ///< IPv4 of the outgoing interface
    std::vector<std::string> unicast_targets;   ///< "host" or "host:port"
};

struct SecurityConfig {
    std::string shared_secret = PLACEHOLDER_SECRET;
};

struct DiscoveryConfig {
    uint32_t announce_interval_ms = 30000;
    uint32_t timestamp_tolerance_s = 60;
    uint32_t rate_limit_per_minute = 5;
    uint32_t worker_threads = 2;
    uint32_t max_pending = 256;
    uint32_t max_datagram_bytes = 4096;
};

struct RegistryConfig {
    std::filesystem::path db_path = "/var/lib/lanbeacon/hosts.db";
    uint32_t stale_threshold_ms = 90000;
    uint32_t expiry_interval_ms = 5000;
};

struct HostsFileConfig {
    bool enabled = false;
    std::filesystem::path path = "/etc/hosts";
};

struct QueryConfig {
    std::filesystem::path socket_path = "/run/lanbeacon/server.sock";
};

struct TelemetryConfig {
    std::filesystem::path log_dir;              ///< Empty = stdout
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::filesystem::path metrics_file;         ///< Empty = no event stream
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    NodeConfig node;
    SecurityConfig security;
    DiscoveryConfig discovery;
    RegistryConfig registry;
    HostsFileConfig hosts_file;
    QueryConfig query;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Paths beginning with '~' are expanded.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Check the settings the daemon cannot start without.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Expand a leading "~" or "~/" to $HOME.
 */
std::filesystem::path expand_path(const std::string& path);

}  // namespace lan_beacon
