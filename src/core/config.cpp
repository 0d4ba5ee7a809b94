/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include "core/types.hpp"
#include "network/subnet.hpp"

#include <cstdlib>

#include <toml++/toml.hpp>

namespace lan_beacon {

std::filesystem::path expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;

    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') return path;

    if (path == "~") return std::filesystem::path{home};
    if (path.starts_with("~/")) return std::filesystem::path{home} / path.substr(2);
    return path;
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [node]
        if (auto node = tbl["node"]; node.is_table()) {
            config.node.role = node["role"].value_or(std::string{"both"});
            config.node.network_range = node["network_range"].value_or(std::string{});
            config.node.port = static_cast<uint16_t>(
                node["port"].value_or(int64_t{5678}));
            config.node.target_mode = node["target_mode"].value_or(std::string{"broadcast"});
            config.node.multicast_group =
                node["multicast_group"].value_or(std::string{"239.255.0.1"});
            config.node.multicast_interface =
                node["multicast_interface"].value_or(std::string{});

            if (auto targets = node["unicast_targets"].as_array()) {
                for (const auto& element : *targets) {
                    if (auto target = element.value<std::string>()) {
                        config.node.unicast_targets.push_back(*target);
                    }
                }
            }
        }

        // [security]
        if (auto security = tbl["security"]; security.is_table()) {
            config.security.shared_secret =
                security["shared_secret"].value_or(std::string{PLACEHOLDER_SECRET});
        }

        // [discovery]
        if (auto discovery = tbl["discovery"]; discovery.is_table()) {
            config.discovery.announce_interval_ms = static_cast<uint32_t>(
                discovery["announce_interval_ms"].value_or(int64_t{30000}));
            config.discovery.timestamp_tolerance_s = static_cast<uint32_t>(
                discovery["timestamp_tolerance_s"].value_or(int64_t{60}));
            config.discovery.rate_limit_per_minute = static_cast<uint32_t>(
                discovery["rate_limit_per_minute"].value_or(int64_t{5}));
            config.discovery.worker_threads = static_cast<uint32_t>(
                discovery["worker_threads"].value_or(int64_t{2}));
            config.discovery.max_pending = static_cast<uint32_t>(
                discovery["max_pending"].value_or(int64_t{256}));
            config.discovery.max_datagram_bytes = static_cast<uint32_t>(
                discovery["max_datagram_bytes"].value_or(int64_t{4096}));
        }

        // [registry]
        if (auto registry = tbl["registry"]; registry.is_table()) {
            config.registry.db_path = expand_path(
                registry["db_path"].value_or(std::string{"/var/lib/lanbeacon/hosts.db"}));
            config.registry.stale_threshold_ms = static_cast<uint32_t>(
                registry["stale_threshold_ms"].value_or(int64_t{90000}));
            config.registry.expiry_interval_ms = static_cast<uint32_t>(
                registry["expiry_interval_ms"].value_or(int64_t{5000}));
        }

        // [hosts_file]
        if (auto hosts = tbl["hosts_file"]; hosts.is_table()) {
            config.hosts_file.enabled = hosts["enabled"].value_or(false);
            config.hosts_file.path = expand_path(
                hosts["path"].value_or(std::string{"/etc/hosts"}));
        }

        // [query]
        if (auto query = tbl["query"]; query.is_table()) {
            config.query.socket_path = expand_path(
                query["socket_path"].value_or(std::string{"/run/lanbeacon/server.sock"}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = expand_path(
                telemetry["log_dir"].value_or(std::string{}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.metrics_file = expand_path(
                telemetry["metrics_file"].value_or(std::string{}));
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidArgument,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    const auto& secret = config.security.shared_secret;
    if (secret.empty() || secret == PLACEHOLDER_SECRET) {
        return Error{ErrorCode::InvalidArgument,
                     "security.shared_secret must be set (not 'CHANGE_ME')"};
    }

    const auto& role = config.node.role;
    if (role != "announce" && role != "listen" && role != "both") {
        return Error{ErrorCode::InvalidArgument, "node.role must be announce, listen or both"};
    }

    const auto& mode = config.node.target_mode;
    if (mode == "broadcast") {
        if (config.node.network_range.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "node.network_range must be set in broadcast mode (e.g. '10.51.240.0/23')"};
        }
    } else if (mode == "multicast") {
        auto group = parse_ipv4(config.node.multicast_group);
        if (!group || !is_multicast(*group)) {
            return Error{ErrorCode::InvalidArgument,
                         "node.multicast_group is not a multicast address: "
                         + config.node.multicast_group};
        }
    } else if (mode == "unicast") {
        if (config.node.unicast_targets.empty() && role != "listen") {
            return Error{ErrorCode::InvalidArgument,
                         "node.unicast_targets must not be empty in unicast mode"};
        }
    } else {
        return Error{ErrorCode::InvalidArgument,
                     "node.target_mode must be broadcast, multicast or unicast"};
    }

    if (!config.node.network_range.empty()) {
        auto network = parse_cidr(config.node.network_range);
        if (!network) {
            return Error{ErrorCode::InvalidArgument,
                         "node.network_range: " + network.error().message};
        }
    }

    const auto& discovery = config.discovery;
    if (discovery.announce_interval_ms == 0) {
        return Error{ErrorCode::InvalidArgument, "discovery.announce_interval_ms must be > 0"};
    }
    if (discovery.rate_limit_per_minute == 0) {
        return Error{ErrorCode::InvalidArgument, "discovery.rate_limit_per_minute must be > 0"};
    }
    if (discovery.worker_threads == 0 || discovery.max_pending == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "discovery.worker_threads and discovery.max_pending must be > 0"};
    }
    if (discovery.max_datagram_bytes <= SIGNATURE_SIZE) {
        return Error{ErrorCode::InvalidArgument,
                     "discovery.max_datagram_bytes must exceed the signature length"};
    }

    if (config.registry.stale_threshold_ms == 0 || config.registry.expiry_interval_ms == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "registry.stale_threshold_ms and registry.expiry_interval_ms must be > 0"};
    }
    if (config.registry.db_path.empty()) {
        return Error{ErrorCode::InvalidArgument, "registry.db_path must be set"};
    }

    return Result<void>{};
}

}  // namespace lan_beacon
