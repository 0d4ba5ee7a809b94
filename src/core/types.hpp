/**
 * @file types.hpp
 * @brief Fundamental types used throughout LanBeacon.
 *
 * Defines HostMetadata (the announced fact about a machine), HostRecord
 * (the registry entity) and the shared vocabulary types around them.
 * All types are plain values.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lan_beacon {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using MacAddress = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;

inline constexpr uint8_t PROTOCOL_VERSION = 1;
inline constexpr size_t SIGNATURE_SIZE = 32;

using Signature = std::array<uint8_t, SIGNATURE_SIZE>;

// ─────────────────────────────────────────────
// Host Metadata
// ─────────────────────────────────────────────

struct OsInfo {
    std::string name;
    std::string kernel;
    std::string arch;

    bool operator==(const OsInfo&) const = default;
};

struct HardwareInfo {
    std::string cpu_model;
    uint32_t cpu_cores{0};
    double memory_gb{0.0};        ///< GiB, rounded to 2 decimals
    uint32_t disk_count{0};

    bool operator==(const HardwareInfo&) const = default;
};

/**
 * @brief The announced fact about a machine.
 *
 * Produced fresh on every announce. Immutable once serialized: the
 * Authenticator signs the exact encoded bytes.
 */
struct HostMetadata {
    uint8_t version{PROTOCOL_VERSION};
    int64_t timestamp{0};         ///< Unix seconds at creation
    MacAddress mac_address;       ///< Canonical lower-case colon hex
    std::string ip_address;       ///< Dotted IPv4
    std::string hostname;
    OsInfo os;
    HardwareInfo hardware;

    bool operator==(const HostMetadata&) const = default;
};

// ─────────────────────────────────────────────
// Host Record
// ─────────────────────────────────────────────

/**
 * @brief Registry entity, keyed by MAC address.
 *
 * first_seen is set once. packet_count grows by exactly one per accepted
 * announce. active is cleared only by the expiry sweep. ssh_key_pushed
 * only ever moves from false to true.
 */
struct HostRecord {
    HostMetadata metadata;
    Timestamp first_seen{};
    Timestamp last_seen{};
    uint64_t packet_count{0};
    bool active{false};
    bool ssh_key_pushed{false};
    std::optional<Timestamp> key_pushed_at;

    bool operator==(const HostRecord&) const = default;
};

// ─────────────────────────────────────────────
// Drop Reasons
// ─────────────────────────────────────────────

/**
 * @brief Why an inbound datagram never reached the registry.
 */
enum class DropReason : uint8_t {
    Oversized,
    RateLimited,
    TooShort,
    BadSignature,
    Malformed,
    StaleTimestamp,
    SelfOrigin,
    QueueFull,
    StorageError
};

inline constexpr size_t DROP_REASON_COUNT = 9;

[[nodiscard]] constexpr std::string_view to_string(DropReason reason) noexcept {
    switch (reason) {
        case DropReason::Oversized:      return "oversized";
        case DropReason::RateLimited:    return "rate_limited";
        case DropReason::TooShort:       return "too_short";
        case DropReason::BadSignature:   return "bad_signature";
        case DropReason::Malformed:      return "malformed";
        case DropReason::StaleTimestamp: return "stale_timestamp";
        case DropReason::SelfOrigin:     return "self_origin";
        case DropReason::QueueFull:      return "queue_full";
        case DropReason::StorageError:   return "storage_error";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Time helpers
// ─────────────────────────────────────────────

[[nodiscard]] inline int64_t to_unix_seconds(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

[[nodiscard]] inline int64_t to_unix_millis(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_unix_millis(int64_t ms) noexcept {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds{ms})};
}

/// Lower-case a MAC address for comparison and storage keys.
[[nodiscard]] std::string canonical_mac(std::string_view mac);

}  // namespace lan_beacon
