/**
 * @file discovery_engine.cpp
 * @brief DiscoveryEngine implementation using POSIX UDP sockets.
 *
 * A single socket, bound to INADDR_ANY, carries both directions. It has
 * SO_BROADCAST for directed-broadcast targets and, in multicast mode, a
 * TTL of 1 so announces never leave the local segment. An announce-only
 * engine binds an ephemeral port so it never competes with a listener on
 * the same host for unicast datagrams.
 */

#include "network/discovery_engine.hpp"

#include "core/logger.hpp"
#include "executor/thread_pool.hpp"
#include "network/subnet.hpp"
#include "protocol/payload_codec.hpp"
#include "registry/host_registry.hpp"
#include "telemetry/metrics_collector.hpp"

#include <arpa/inet.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lan_beacon {

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

}  // anonymous namespace

Result<Role> parse_role(std::string_view name) {
    if (name == "announce") return Role::Announce;
    if (name == "listen") return Role::Listen;
    if (name == "both") return Role::Both;
    return Error{ErrorCode::InvalidArgument, "Unknown role: " + std::string(name)};
}

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

DiscoveryEngine::DiscoveryEngine(EngineOptions options,
                                 Authenticator authenticator,
                                 MetadataProvider provider,
                                 HostRegistry& registry,
                                 Logger& logger,
                                 DiscoveryMetrics* metrics)
    : options_(std::move(options))
    , authenticator_(std::move(authenticator))
    , validator_(authenticator_, options_.local_mac, options_.timestamp_tolerance, &logger)
    , rate_limiter_(options_.rate_limit_per_minute, std::chrono::seconds(60))
    , provider_(std::move(provider))
    , registry_(registry)
    , logger_(logger)
    , metrics_(metrics) {}

DiscoveryEngine::~DiscoveryEngine() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> DiscoveryEngine::start() {
    if (running_.load()) {
        return Error{ErrorCode::InvalidArgument, "Discovery engine already running"};
    }

    targets_.clear();
    if (announces()) {
        TargetSpec target_spec;
        target_spec.mode = options_.target_mode;
        target_spec.network_range = options_.network_range;
        target_spec.multicast_group = options_.multicast_group;
        target_spec.unicast_targets = options_.unicast_targets;
        target_spec.port = options_.port;

        auto resolved = resolve_targets(target_spec, &logger_);
        if (!resolved) return resolved.error();
        targets_ = std::move(*resolved);
    }

    if (auto opened = open_socket(); !opened) {
        close_socket();
        return opened.error();
    }

    running_ = true;

    if (listens()) {
        pool_ = std::make_unique<ThreadPool>(options_.worker_threads, options_.max_pending);
        receive_thread_ = std::jthread([this](std::stop_token stop) {
            receive_loop(stop);
        });
    }
    if (announces()) {
        announce_thread_ = std::jthread([this](std::stop_token stop) {
            announce_loop(stop);
        });
    }

    logger_.info("Discovery engine started (role " + std::string(to_string(options_.role))
                 + ", port " + std::to_string(bound_port()) + ", "
                 + std::to_string(targets_.size()) + " targets)");
    return Result<void>{};
}

void DiscoveryEngine::stop() {
    if (announce_thread_.joinable()) announce_thread_.request_stop();
    if (receive_thread_.joinable()) receive_thread_.request_stop();
    if (announce_thread_.joinable()) announce_thread_.join();
    if (receive_thread_.joinable()) receive_thread_.join();

    if (pool_) {
        pool_->shutdown();
        pool_.reset();
    }

    close_socket();

    if (running_.exchange(false)) {
        logger_.info("Discovery engine stopped");
    }
}

void DiscoveryEngine::on_host_accepted(HostCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_accepted_.push_back(std::move(callback));
}

// ─────────────────────────────────────────────
// Socket
// ─────────────────────────────────────────────

Result<void> DiscoveryEngine::open_socket() {
    socket_fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (socket_fd_ < 0) {
        return Error{ErrorCode::Io, "Failed to create UDP socket: " + errno_text()};
    }

    int optval = 1;
    if (::setsockopt(socket_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0
        || ::setsockopt(socket_fd_, SOL_SOCKET, SO_BROADCAST, &optval, sizeof(optval)) < 0) {
        return Error{ErrorCode::Io, "Failed to configure UDP socket: " + errno_text()};
    }

    if (options_.target_mode == TargetMode::Multicast) {
        auto group = parse_ipv4(options_.multicast_group);
        if (!group || !is_multicast(*group)) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid multicast group: " + options_.multicast_group};
        }

        in_addr iface{};
        iface.s_addr = htonl(INADDR_ANY);
        if (!options_.multicast_interface.empty()) {
            auto parsed = parse_ipv4(options_.multicast_interface);
            if (!parsed) return parsed.error();
            iface.s_addr = htonl(*parsed);
            if (::setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_IF,
                             &iface, sizeof(iface)) < 0) {
                return Error{ErrorCode::Io, "IP_MULTICAST_IF failed: " + errno_text()};
            }
        }

        unsigned char ttl = 1;
        if (::setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
            return Error{ErrorCode::Io, "IP_MULTICAST_TTL failed: " + errno_text()};
        }

        if (listens()) {
            ip_mreq membership{};
            membership.imr_multiaddr.s_addr = htonl(*group);
            membership.imr_interface = iface;
            if (::setsockopt(socket_fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP,
                             &membership, sizeof(membership)) < 0) {
                return Error{ErrorCode::Io, "Failed to join multicast group "
                                            + options_.multicast_group + ": " + errno_text()};
            }
        }
    }

    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_port = htons(listens() ? options_.port : 0);
    bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);

    if (::bind(socket_fd_, reinterpret_cast<const sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        return Error{ErrorCode::Io, "Bind to UDP port " + std::to_string(options_.port)
                                    + " failed: " + errno_text()};
    }

    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(socket_fd_, reinterpret_cast<sockaddr*>(&actual), &len) < 0) {
        return Error{ErrorCode::Io, "getsockname failed: " + errno_text()};
    }
    bound_port_ = ntohs(actual.sin_port);

    return Result<void>{};
}

void DiscoveryEngine::close_socket() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
    bound_port_ = 0;
}

// ─────────────────────────────────────────────
// Announce Thread
// ─────────────────────────────────────────────

Result<void> DiscoveryEngine::announce_once() {
    if (socket_fd_ < 0) {
        return Error{ErrorCode::Io, "Socket not open"};
    }

    auto metadata = provider_();
    if (!metadata) {
        if (metrics_) metrics_->record_announce(false, 0);
        return Error{metadata.error().code,
                     "Cannot collect local metadata: " + metadata.error().message};
    }

    auto packet = authenticator_.seal(PayloadCodec::encode(*metadata));
    if (!packet) {
        if (metrics_) metrics_->record_announce(false, 0);
        return Error{packet.error().code, "Cannot sign announce: " + packet.error().message};
    }

    size_t failures = 0;
    std::string last_error;
    for (const auto& target : targets_) {
        sockaddr_in dest{};
        dest.sin_family = AF_INET;
        dest.sin_port = htons(target.port);
        dest.sin_addr.s_addr = htonl(target.address);

        auto sent = ::sendto(socket_fd_, packet->data(), packet->size(), 0,
                             reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
        if (sent != static_cast<ssize_t>(packet->size())) {
            ++failures;
            last_error = target.to_string() + ": " + errno_text();
        }
    }

    if (metrics_) metrics_->record_announce(failures == 0, targets_.size());

    if (failures > 0) {
        return Error{ErrorCode::Io, "Announce failed for " + std::to_string(failures)
                                    + " of " + std::to_string(targets_.size())
                                    + " targets (" + last_error + ")"};
    }

    logger_.debug("Announced " + std::to_string(packet->size()) + " bytes to "
                  + std::to_string(targets_.size()) + " targets");
    return Result<void>{};
}

void DiscoveryEngine::announce_loop(std::stop_token stop) {
    // The first announce goes out even if stop was requested right after start()
    do {
        if (auto sent = announce_once(); !sent) {
            logger_.warn(sent.error().message);
        }

        // Sleep in small increments to respond to stop requests promptly
        auto deadline = std::chrono::steady_clock::now() + options_.announce_interval;
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    } while (!stop.stop_requested());
}

// ─────────────────────────────────────────────
// Receive Thread
// ─────────────────────────────────────────────

void DiscoveryEngine::receive_loop(std::stop_token stop) {
    std::vector<uint8_t> buffer(options_.max_datagram_bytes);

    while (!stop.stop_requested()) {
        if (socket_fd_ < 0) break;

        pollfd pfd{};
        pfd.fd = socket_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, 100);  // 100ms timeout
        if (ready <= 0) continue;

        sockaddr_in sender_addr{};
        socklen_t addr_len = sizeof(sender_addr);

        // MSG_TRUNC reports the full datagram length even when it did not fit
        auto bytes_read = ::recvfrom(socket_fd_, buffer.data(), buffer.size(), MSG_TRUNC,
                                     reinterpret_cast<sockaddr*>(&sender_addr), &addr_len);
        if (bytes_read < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                logger_.warn("recvfrom failed: " + errno_text());
            }
            continue;
        }

        char ip_buf[INET_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET, &sender_addr.sin_addr, ip_buf, sizeof(ip_buf));
        std::string sender(ip_buf);

        auto wire_size = static_cast<size_t>(bytes_read);
        auto held = std::min(wire_size, buffer.size());
        process_datagram(std::span<const uint8_t>(buffer.data(), held), wire_size, sender);
    }
}

void DiscoveryEngine::process_datagram(std::span<const uint8_t> datagram, size_t wire_size,
                                       const std::string& sender) {
    if (metrics_) metrics_->record_received(sender, wire_size);

    // Every datagram counts against its sender, whatever its size
    if (!rate_limiter_.allow(sender, std::chrono::steady_clock::now())) {
        drop(DropReason::RateLimited, sender);
        return;
    }

    if (wire_size > options_.max_datagram_bytes) {
        drop(DropReason::Oversized, sender);
        return;
    }

    auto metadata = validator_.validate(datagram, sender, std::chrono::system_clock::now());
    if (!metadata) {
        drop(metadata.error(), sender);
        return;
    }

    bool queued = pool_ && pool_->try_submit(
        [this, accepted = std::move(*metadata), sender] {
            handle_accepted(accepted, sender);
        });
    if (!queued) {
        drop(DropReason::QueueFull, sender);
    }
}

void DiscoveryEngine::handle_accepted(const HostMetadata& metadata, const std::string& sender) {
    auto record = registry_.upsert(metadata);
    if (!record) {
        logger_.error("Registry upsert failed for " + metadata.mac_address + ": "
                      + record.error().message);
        drop(DropReason::StorageError, sender);
        return;
    }

    if (record->packet_count == 1) {
        logger_.info("New host discovered: " + metadata.hostname + " ("
                     + metadata.mac_address + ", " + metadata.ip_address + ")");
    } else {
        logger_.debug("Host refreshed: " + metadata.mac_address + " (packet "
                      + std::to_string(record->packet_count) + ")");
    }

    if (metrics_) metrics_->record_accepted(*record);

    std::lock_guard lock(callback_mutex_);
    for (const auto& cb : on_accepted_) {
        cb(*record);
    }
}

void DiscoveryEngine::drop(DropReason reason, const std::string& sender) {
    if (metrics_) metrics_->record_drop(reason, sender);

    switch (reason) {
        case DropReason::BadSignature:
        case DropReason::StorageError:
        case DropReason::QueueFull:
            logger_.warn("Dropped datagram from " + sender + ": "
                         + std::string(to_string(reason)));
            break;
        case DropReason::Oversized:
        case DropReason::RateLimited:
            logger_.debug("Dropped datagram from " + sender + ": "
                          + std::string(to_string(reason)));
            break;
        default:
            // Validation rejections are logged by the validator
            break;
    }
}

}  // namespace lan_beacon
