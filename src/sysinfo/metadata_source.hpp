/**
 * @file metadata_source.hpp
 * @brief Producers of the local HostMetadata announced by this machine.
 *
 * Provides LinuxMetadataSource (reads from getifaddrs, uname, /proc, /etc)
 * and StaticMetadataSource (tests and demos). Both satisfy
 * MetadataSourceLike.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace lan_beacon {

// ─────────────────────────────────────────────
// Parsing helpers (exposed for tests)
// ─────────────────────────────────────────────

/// PRETTY_NAME value from /etc/os-release content, quotes stripped.
[[nodiscard]] std::string parse_os_pretty_name(std::string_view os_release);

/// First "model name" (or "Model" on ARM) value from /proc/cpuinfo content.
[[nodiscard]] std::string parse_cpu_model(std::string_view cpuinfo);

/// MemTotal from /proc/meminfo content in GiB, rounded to 2 decimals.
[[nodiscard]] double parse_memory_gb(std::string_view meminfo);

/// Number of distinct /dev/ block devices mounted, from /proc/mounts content.
[[nodiscard]] uint32_t count_mounted_disks(std::string_view mounts);

// ─────────────────────────────────────────────
// LinuxMetadataSource
// ─────────────────────────────────────────────

/**
 * @brief Collects identity and hardware facts from the running Linux host.
 *
 * The announcing interface is the first up, non-loopback interface with a
 * hardware address whose IPv4 address lies in network_range. With an empty
 * range the first such interface wins. Static facts are gathered once;
 * read() refreshes the interface and the timestamp.
 */
class LinuxMetadataSource {
public:
    explicit LinuxMetadataSource(std::string network_range = {});

    Result<HostMetadata> read();

private:
    Result<void> detect_interface(HostMetadata& metadata) const;
    void collect_static(HostMetadata& metadata) const;

    std::string network_range_;
    std::mutex mutex_;
    bool static_collected_{false};
    HostMetadata cached_;
};

// ─────────────────────────────────────────────
// StaticMetadataSource
// ─────────────────────────────────────────────

/**
 * @brief Returns a fixed snapshot stamped with the current time.
 */
class StaticMetadataSource {
public:
    explicit StaticMetadataSource(HostMetadata snapshot);

    Result<HostMetadata> read();

    void set_snapshot(HostMetadata snapshot);
    void set_failure(std::string message);

private:
    std::mutex mutex_;
    HostMetadata snapshot_;
    std::string failure_;
};

static_assert(MetadataSourceLike<LinuxMetadataSource>);
static_assert(MetadataSourceLike<StaticMetadataSource>);

}  // namespace lan_beacon
