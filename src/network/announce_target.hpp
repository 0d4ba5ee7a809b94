/**
 * @file announce_target.hpp
 * @brief Resolution of the destinations an announce is sent to.
 *
 * Broadcast mode sends to the directed broadcast address of network_range,
 * multicast mode to the configured group. Unicast targets are appended in
 * every mode; unicast mode uses them alone.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lan_beacon {

class Logger;

enum class TargetMode : uint8_t {
    Broadcast,
    Multicast,
    Unicast
};

[[nodiscard]] constexpr std::string_view to_string(TargetMode mode) noexcept {
    switch (mode) {
        case TargetMode::Broadcast: return "broadcast";
        case TargetMode::Multicast: return "multicast";
        case TargetMode::Unicast:   return "unicast";
    }
    return "unknown";
}

Result<TargetMode> parse_target_mode(std::string_view name);

struct AnnounceTarget {
    uint32_t address{0};      ///< Host-order IPv4
    uint16_t port{0};

    [[nodiscard]] std::string to_string() const;
    bool operator==(const AnnounceTarget&) const = default;
};

struct TargetSpec {
    TargetMode mode{TargetMode::Broadcast};
    std::string network_range;
    std::string multicast_group;
    std::vector<std::string> unicast_targets;
    uint16_t port{0};
};

/**
 * @brief Split "host" or "host:port". A missing port yields @p default_port.
 */
Result<std::pair<std::string, uint16_t>> parse_host_port(std::string_view text,
                                                         uint16_t default_port);

/// Resolve a host name or dotted quad to a host-order IPv4 address.
Result<uint32_t> resolve_ipv4(const std::string& host);

/**
 * @brief Build the target list.
 *
 * A broadcast range or multicast group that does not parse is an error.
 * An unresolvable unicast entry is logged and skipped. An empty final
 * list is an error.
 */
Result<std::vector<AnnounceTarget>> resolve_targets(const TargetSpec& target_spec,
                                                    Logger* logger = nullptr);

}  // namespace lan_beacon
