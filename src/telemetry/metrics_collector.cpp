/**
 * @file metrics_collector.cpp
 * @brief DiscoveryMetrics implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace lan_beacon {

namespace {

int64_t now_ms() {
    return to_unix_millis(std::chrono::system_clock::now());
}

}  // anonymous namespace

uint64_t MetricsSummary::total_drops() const noexcept {
    uint64_t total = 0;
    for (auto count : drops) total += count;
    return total;
}

DiscoveryMetrics::DiscoveryMetrics(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void DiscoveryMetrics::record_announce(bool success, size_t targets) {
    (success ? announces_sent_ : announces_failed_).fetch_add(1, std::memory_order_relaxed);
    if (!sink_) return;

    std::ostringstream oss;
    oss << R"({"event":"announce")"
        << R"(,"ts_ms":)" << now_ms()
        << R"(,"ok":)" << (success ? "true" : "false")
        << R"(,"targets":)" << targets
        << "}";
    emit(oss.str());
}

void DiscoveryMetrics::record_received(const std::string& sender, size_t bytes) {
    datagrams_received_.fetch_add(1, std::memory_order_relaxed);
    if (!sink_) return;

    std::ostringstream oss;
    oss << R"({"event":"datagram")"
        << R"(,"ts_ms":)" << now_ms()
        << R"(,"from":")" << json_escape(sender) << "\""
        << R"(,"bytes":)" << bytes
        << "}";
    emit(oss.str());
}

void DiscoveryMetrics::record_accepted(const HostRecord& record) {
    accepted_.fetch_add(1, std::memory_order_relaxed);
    if (!sink_) return;

    std::ostringstream oss;
    oss << R"({"event":"host_accepted")"
        << R"(,"ts_ms":)" << now_ms()
        << R"(,"mac":")" << json_escape(record.metadata.mac_address) << "\""
        << R"(,"ip":")" << json_escape(record.metadata.ip_address) << "\""
        << R"(,"hostname":")" << json_escape(record.metadata.hostname) << "\""
        << R"(,"packet_count":)" << record.packet_count
        << "}";
    emit(oss.str());
}

void DiscoveryMetrics::record_drop(DropReason reason, const std::string& sender) {
    drops_[static_cast<size_t>(reason)].fetch_add(1, std::memory_order_relaxed);
    if (!sink_) return;

    std::ostringstream oss;
    oss << R"({"event":"drop")"
        << R"(,"ts_ms":)" << now_ms()
        << R"(,"reason":")" << to_string(reason) << "\""
        << R"(,"from":")" << json_escape(sender) << "\""
        << "}";
    emit(oss.str());
}

void DiscoveryMetrics::record_expired(const HostRecord& record) {
    hosts_expired_.fetch_add(1, std::memory_order_relaxed);
    if (!sink_) return;

    std::ostringstream oss;
    oss << R"({"event":"host_expired")"
        << R"(,"ts_ms":)" << now_ms()
        << R"(,"mac":")" << json_escape(record.metadata.mac_address) << "\""
        << R"(,"last_seen_ms":)" << to_unix_millis(record.last_seen)
        << "}";
    emit(oss.str());
}

MetricsSummary DiscoveryMetrics::summary() const {
    MetricsSummary s;
    s.announces_sent = announces_sent_.load(std::memory_order_relaxed);
    s.announces_failed = announces_failed_.load(std::memory_order_relaxed);
    s.datagrams_received = datagrams_received_.load(std::memory_order_relaxed);
    s.accepted = accepted_.load(std::memory_order_relaxed);
    s.hosts_expired = hosts_expired_.load(std::memory_order_relaxed);
    for (size_t i = 0; i < DROP_REASON_COUNT; ++i) {
        s.drops[i] = drops_[i].load(std::memory_order_relaxed);
    }
    return s;
}

std::string DiscoveryMetrics::status_line() const {
    auto s = summary();
    std::ostringstream oss;
    oss << "announces " << s.announces_sent << " sent / " << s.announces_failed << " failed, "
        << "datagrams " << s.datagrams_received << ", accepted " << s.accepted
        << ", expired " << s.hosts_expired << ", dropped " << s.total_drops();
    if (s.total_drops() > 0) {
        oss << " (";
        bool first = true;
        for (size_t i = 0; i < DROP_REASON_COUNT; ++i) {
            if (s.drops[i] == 0) continue;
            if (!first) oss << ", ";
            oss << to_string(static_cast<DropReason>(i)) << '=' << s.drops[i];
            first = false;
        }
        oss << ")";
    }
    return oss.str();
}

void DiscoveryMetrics::emit(std::string_view json_line) {
    if (!sink_) return;
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void DiscoveryMetrics::flush() {
    if (!sink_) return;
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace lan_beacon
