/**
 * @file metrics_collector.hpp
 * @brief Discovery counters and structured NDJSON event stream.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace lan_beacon {

/**
 * @brief Point-in-time copy of the discovery counters.
 */
struct MetricsSummary {
    uint64_t announces_sent{0};
    uint64_t announces_failed{0};
    uint64_t datagrams_received{0};
    uint64_t accepted{0};
    uint64_t hosts_expired{0};
    std::array<uint64_t, DROP_REASON_COUNT> drops{};

    [[nodiscard]] uint64_t drops_for(DropReason reason) const noexcept {
        return drops[static_cast<size_t>(reason)];
    }
    [[nodiscard]] uint64_t total_drops() const noexcept;
};

/**
 * @brief Counts discovery activity and optionally logs each event as NDJSON.
 *
 * Counters are lock-free. With a NullSink (or no sink) the event stream is
 * disabled and only the counters are kept.
 */
class DiscoveryMetrics {
public:
    explicit DiscoveryMetrics(std::unique_ptr<ILogSink> sink = nullptr);

    void record_announce(bool success, size_t targets);
    void record_received(const std::string& sender, size_t bytes);
    void record_accepted(const HostRecord& record);
    void record_drop(DropReason reason, const std::string& sender);
    void record_expired(const HostRecord& record);

    [[nodiscard]] MetricsSummary summary() const;

    /// One-line human summary for the periodic status log.
    [[nodiscard]] std::string status_line() const;

    void flush();

private:
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    std::atomic<uint64_t> announces_sent_{0};
    std::atomic<uint64_t> announces_failed_{0};
    std::atomic<uint64_t> datagrams_received_{0};
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> hosts_expired_{0};
    std::array<std::atomic<uint64_t>, DROP_REASON_COUNT> drops_{};
};

}  // namespace lan_beacon
