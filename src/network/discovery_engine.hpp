/**
 * @file discovery_engine.hpp
 * @brief Signed UDP announce/listen engine feeding the host registry.
 *
 * One engine per process, with its duties chosen by Role. The announce
 * loop sends a signed HostMetadata snapshot immediately and then every
 * interval. The receive loop filters datagrams through rate, size and
 * validation checks on its own thread and hands accepted metadata to a
 * bounded worker pool, which performs the registry upsert and notifies
 * the accepted-host callbacks. A full queue drops the datagram instead of
 * blocking the receive loop.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "network/announce_target.hpp"
#include "protocol/authenticator.hpp"
#include "protocol/packet_validator.hpp"
#include "protocol/rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace lan_beacon {

class DiscoveryMetrics;
class HostRegistry;
class Logger;
class ThreadPool;

enum class Role : uint8_t {
    Announce,
    Listen,
    Both
};

[[nodiscard]] constexpr std::string_view to_string(Role role) noexcept {
    switch (role) {
        case Role::Announce: return "announce";
        case Role::Listen:   return "listen";
        case Role::Both:     return "both";
    }
    return "unknown";
}

Result<Role> parse_role(std::string_view name);

struct EngineOptions {
    Role role{Role::Both};
    uint16_t port{5678};                          ///< Listen port, and default target port. 0 = ephemeral.
    TargetMode target_mode{TargetMode::Broadcast};
    std::string network_range;
    std::string multicast_group{"239.255.0.1"};
    std::string multicast_interface;              ///< IPv4 of the outgoing interface, optional
    std::vector<std::string> unicast_targets;     ///< "host" or "host:port"
    std::chrono::milliseconds announce_interval{30000};
    std::chrono::seconds timestamp_tolerance{60};
    uint32_t rate_limit_per_minute{5};
    size_t worker_threads{2};
    size_t max_pending{256};
    size_t max_datagram_bytes{4096};
    MacAddress local_mac;
};

using MetadataProvider = std::function<Result<HostMetadata>()>;
using HostCallback = std::function<void(const HostRecord&)>;

class DiscoveryEngine {
public:
    DiscoveryEngine(EngineOptions options,
                    Authenticator authenticator,
                    MetadataProvider provider,
                    HostRegistry& registry,
                    Logger& logger,
                    DiscoveryMetrics* metrics = nullptr);
    ~DiscoveryEngine();

    // Non-copyable
    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /**
     * @brief Resolve targets, open the socket and launch the role's loops.
     *
     * On failure nothing is left running and the socket is closed.
     */
    Result<void> start();

    /// Stop both loops, discard queued upserts and close the socket.
    void stop();

    /// Registered before start(); called on a worker thread after each upsert.
    void on_host_accepted(HostCallback callback);

    /// Encode, sign and send one announce to every target.
    Result<void> announce_once();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_.load(); }
    [[nodiscard]] const std::vector<AnnounceTarget>& targets() const noexcept { return targets_; }
    [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] bool announces() const noexcept { return options_.role != Role::Listen; }
    [[nodiscard]] bool listens() const noexcept { return options_.role != Role::Announce; }

    Result<void> open_socket();
    void close_socket();

    void announce_loop(std::stop_token stop);
    void receive_loop(std::stop_token stop);

    void process_datagram(std::span<const uint8_t> datagram, size_t wire_size,
                          const std::string& sender);
    void handle_accepted(const HostMetadata& metadata, const std::string& sender);
    void drop(DropReason reason, const std::string& sender);

    EngineOptions options_;
    Authenticator authenticator_;
    PacketValidator validator_;
    RateLimiter rate_limiter_;
    MetadataProvider provider_;
    HostRegistry& registry_;
    Logger& logger_;
    DiscoveryMetrics* metrics_;

    int socket_fd_ = -1;
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<bool> running_{false};
    std::vector<AnnounceTarget> targets_;

    std::unique_ptr<ThreadPool> pool_;
    std::jthread announce_thread_;
    std::jthread receive_thread_;

    std::mutex callback_mutex_;
    std::vector<HostCallback> on_accepted_;
};

}  // namespace lan_beacon
