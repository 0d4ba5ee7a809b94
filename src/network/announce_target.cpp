/**
 * @file announce_target.cpp
 * @brief Announce target resolution via getaddrinfo.
 */

#include "network/announce_target.hpp"

#include "core/logger.hpp"
#include "network/subnet.hpp"

#include <arpa/inet.h>
#include <charconv>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <memory>

namespace lan_beacon {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const noexcept { ::freeaddrinfo(info); }
};

}  // anonymous namespace

Result<TargetMode> parse_target_mode(std::string_view name) {
    if (name == "broadcast") return TargetMode::Broadcast;
    if (name == "multicast") return TargetMode::Multicast;
    if (name == "unicast") return TargetMode::Unicast;
    return Error{ErrorCode::InvalidArgument, "Unknown target mode: " + std::string(name)};
}

std::string AnnounceTarget::to_string() const {
    return format_ipv4(address) + ":" + std::to_string(port);
}

Result<std::pair<std::string, uint16_t>> parse_host_port(std::string_view text,
                                                         uint16_t default_port) {
    if (text.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty target"};
    }

    auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        return std::make_pair(std::string(text), default_port);
    }

    auto host = text.substr(0, colon);
    auto port_text = text.substr(colon + 1);
    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (host.empty() || port_text.empty() || ec != std::errc{}
        || ptr != port_text.data() + port_text.size() || port == 0 || port > 65535) {
        return Error{ErrorCode::InvalidArgument, "Invalid target: " + std::string(text)};
    }
    return std::make_pair(std::string(host), static_cast<uint16_t>(port));
}

Result<uint32_t> resolve_ipv4(const std::string& host) {
    if (auto literal = parse_ipv4(host)) {
        return *literal;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo* raw = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &raw);
    if (rc != 0 || raw == nullptr) {
        return Error{ErrorCode::NotFound,
                     "Cannot resolve " + host + ": " + ::gai_strerror(rc)};
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> info(raw);

    const auto* in = reinterpret_cast<const sockaddr_in*>(info->ai_addr);
    return static_cast<uint32_t>(ntohl(in->sin_addr.s_addr));
}

Result<std::vector<AnnounceTarget>> resolve_targets(const TargetSpec& target_spec, Logger* logger) {
    std::vector<AnnounceTarget> targets;

    switch (target_spec.mode) {
        case TargetMode::Broadcast: {
            auto network = parse_cidr(target_spec.network_range);
            if (!network) {
                return Error{ErrorCode::InvalidArgument,
                             "Broadcast mode needs a valid network_range: "
                             + network.error().message};
            }
            targets.push_back({network->broadcast(), target_spec.port});
            break;
        }
        case TargetMode::Multicast: {
            auto group = parse_ipv4(target_spec.multicast_group);
            if (!group || !is_multicast(*group)) {
                return Error{ErrorCode::InvalidArgument,
                             "Invalid multicast group: " + target_spec.multicast_group};
            }
            targets.push_back({*group, target_spec.port});
            break;
        }
        case TargetMode::Unicast:
            break;
    }

    for (const auto& entry : target_spec.unicast_targets) {
        auto host_port = parse_host_port(entry, target_spec.port);
        if (!host_port) {
            if (logger) logger->warn(host_port.error().message);
            continue;
        }
        auto address = resolve_ipv4(host_port->first);
        if (!address) {
            if (logger) logger->warn("Skipping unicast target: " + address.error().message);
            continue;
        }
        AnnounceTarget target{*address, host_port->second};
        if (std::find(targets.begin(), targets.end(), target) == targets.end()) {
            targets.push_back(target);
        }
    }

    if (targets.empty()) {
        return Error{ErrorCode::InvalidArgument, "No announce targets resolved"};
    }
    return targets;
}

}  // namespace lan_beacon
