/**
 * @file linux_metadata_source.cpp
 * @brief LinuxMetadataSource: identity from getifaddrs/uname, hardware
 *        facts from /proc and /etc.
 */

#include "sysinfo/metadata_source.hpp"

#include "network/subnet.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <thread>

namespace lan_beacon {

// ─────────────────────────────────────────────
// Internal helpers for /proc and /etc parsing
// ─────────────────────────────────────────────
namespace {

std::string read_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) return {};
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Visit each line of @p text until the visitor returns false.
template <typename F>
void for_each_line(std::string_view text, F&& visit) {
    size_t pos = 0;
    while (pos < text.size()) {
        auto eol = text.find('\n', pos);
        auto line = text.substr(pos, eol == std::string_view::npos ? std::string_view::npos
                                                                     : eol - pos);
        pos = (eol == std::string_view::npos) ? text.size() : eol + 1;
        if (!visit(line)) return;
    }
}

/// Value after the first ':' of a "key : value" line.
std::string_view value_after_colon(std::string_view line) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos) return {};
    return trim(line.substr(colon + 1));
}

std::string format_mac(const unsigned char* addr, size_t len) {
    std::string mac;
    char buf[4];
    for (size_t i = 0; i < len; ++i) {
        std::snprintf(buf, sizeof(buf), i == 0 ? "%02x" : ":%02x", addr[i]);
        mac += buf;
    }
    return mac;
}

struct IfAddrsDeleter {
    void operator()(ifaddrs* list) const noexcept { ::freeifaddrs(list); }
};

}  // anonymous namespace

std::string parse_os_pretty_name(std::string_view os_release) {
    std::string result;
    for_each_line(os_release, [&](std::string_view line) {
        constexpr std::string_view key = "PRETTY_NAME=";
        if (!line.starts_with(key)) return true;
        auto value = trim(line.substr(key.size()));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')
            && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        result.assign(value);
        return false;
    });
    return result;
}

std::string parse_cpu_model(std::string_view cpuinfo) {
    std::string model;
    std::string fallback;
    for_each_line(cpuinfo, [&](std::string_view line) {
        if (line.starts_with("model name")) {
            model.assign(value_after_colon(line));
            return false;
        }
        if (fallback.empty() && line.starts_with("Model")) {
            fallback.assign(value_after_colon(line));
        }
        return true;
    });
    return model.empty() ? fallback : model;
}

double parse_memory_gb(std::string_view meminfo) {
    double gb = 0.0;
    for_each_line(meminfo, [&](std::string_view line) {
        if (!line.starts_with("MemTotal:")) return true;
        std::istringstream iss{std::string(value_after_colon(line))};
        uint64_t kib = 0;
        if (iss >> kib) {
            double raw = static_cast<double>(kib) / (1024.0 * 1024.0);
            gb = std::round(raw * 100.0) / 100.0;
        }
        return false;
    });
    return gb;
}

uint32_t count_mounted_disks(std::string_view mounts) {
    std::set<std::string> devices;
    for_each_line(mounts, [&](std::string_view line) {
        auto space = line.find(' ');
        auto device = line.substr(0, space);
        if (device.starts_with("/dev/") && !device.starts_with("/dev/loop")) {
            devices.emplace(device);
        }
        return true;
    });
    return static_cast<uint32_t>(devices.size());
}

// ─────────────────────────────────────────────
// LinuxMetadataSource
// ─────────────────────────────────────────────

LinuxMetadataSource::LinuxMetadataSource(std::string network_range)
    : network_range_(std::move(network_range)) {}

Result<HostMetadata> LinuxMetadataSource::read() {
    std::lock_guard lock(mutex_);

    if (!static_collected_) {
        collect_static(cached_);
        static_collected_ = true;
    }

    auto metadata = cached_;
    if (auto iface = detect_interface(metadata); !iface) {
        return iface.error();
    }
    metadata.timestamp = to_unix_seconds(std::chrono::system_clock::now());
    return metadata;
}

Result<void> LinuxMetadataSource::detect_interface(HostMetadata& metadata) const {
    std::optional<Ipv4Network> range;
    if (!network_range_.empty()) {
        auto parsed = parse_cidr(network_range_);
        if (!parsed) return parsed.error();
        range = *parsed;
    }

    ifaddrs* raw = nullptr;
    if (::getifaddrs(&raw) != 0) {
        return Error{ErrorCode::Io, "getifaddrs failed"};
    }
    std::unique_ptr<ifaddrs, IfAddrsDeleter> list(raw);

    // Hardware addresses come from the AF_PACKET entries
    std::map<std::string, std::string> macs;
    for (auto* ifa = list.get(); ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_PACKET) continue;
        const auto* ll = reinterpret_cast<const sockaddr_ll*>(ifa->ifa_addr);
        if (ll->sll_halen == 0) continue;
        auto mac = format_mac(ll->sll_addr, ll->sll_halen);
        if (mac.find_first_not_of("0:") == std::string::npos) continue;
        macs[ifa->ifa_name] = mac;
    }

    for (auto* ifa = list.get(); ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;

        auto mac = macs.find(ifa->ifa_name);
        if (mac == macs.end()) continue;

        const auto* in = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
        uint32_t address = ntohl(in->sin_addr.s_addr);
        if (range && !range->contains(address)) continue;

        metadata.mac_address = mac->second;
        metadata.ip_address = format_ipv4(address);
        return Result<void>{};
    }

    if (range) {
        return Error{ErrorCode::NotFound,
                     "No interface found matching network range " + network_range_};
    }
    return Error{ErrorCode::NotFound, "No suitable network interface found"};
}

void LinuxMetadataSource::collect_static(HostMetadata& metadata) const {
    char host[256] = {};
    if (::gethostname(host, sizeof(host) - 1) == 0) {
        metadata.hostname = host;
    }

    utsname uts{};
    if (::uname(&uts) == 0) {
        metadata.os.kernel = uts.release;
        metadata.os.arch = uts.machine;
        metadata.os.name = uts.sysname;
    }
    if (auto pretty = parse_os_pretty_name(read_file("/etc/os-release")); !pretty.empty()) {
        metadata.os.name = std::move(pretty);
    }

    metadata.hardware.cpu_model = parse_cpu_model(read_file("/proc/cpuinfo"));
    metadata.hardware.cpu_cores = std::thread::hardware_concurrency();
    metadata.hardware.memory_gb = parse_memory_gb(read_file("/proc/meminfo"));
    metadata.hardware.disk_count = count_mounted_disks(read_file("/proc/mounts"));
}

}  // namespace lan_beacon
