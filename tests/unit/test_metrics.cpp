/**
 * @file test_metrics.cpp
 * @brief Unit tests for discovery counters and the NDJSON event stream.
 */

#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace lan_beacon;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines)
        : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

HostRecord record() {
    HostRecord r;
    r.metadata.mac_address = "aa:bb:cc:dd:ee:01";
    r.metadata.ip_address = "192.168.1.10";
    r.metadata.hostname = "host-a";
    r.packet_count = 3;
    return r;
}

}  // namespace

TEST(DiscoveryMetricsTest, CountersWithoutSink) {
    DiscoveryMetrics metrics;
    metrics.record_announce(true, 2);
    metrics.record_announce(false, 2);
    metrics.record_received("192.168.1.10", 200);
    metrics.record_accepted(record());
    metrics.record_drop(DropReason::BadSignature, "192.168.1.66");
    metrics.record_drop(DropReason::BadSignature, "192.168.1.66");
    metrics.record_drop(DropReason::RateLimited, "192.168.1.66");
    metrics.record_expired(record());

    auto s = metrics.summary();
    EXPECT_EQ(s.announces_sent, 1u);
    EXPECT_EQ(s.announces_failed, 1u);
    EXPECT_EQ(s.datagrams_received, 1u);
    EXPECT_EQ(s.accepted, 1u);
    EXPECT_EQ(s.hosts_expired, 1u);
    EXPECT_EQ(s.drops_for(DropReason::BadSignature), 2u);
    EXPECT_EQ(s.drops_for(DropReason::RateLimited), 1u);
    EXPECT_EQ(s.drops_for(DropReason::Malformed), 0u);
    EXPECT_EQ(s.total_drops(), 3u);
}

TEST(DiscoveryMetricsTest, EmitsOneEventPerOccurrence) {
    auto lines = std::make_shared<std::vector<std::string>>();
    DiscoveryMetrics metrics(std::make_unique<CaptureSink>(lines));

    metrics.record_accepted(record());
    metrics.record_drop(DropReason::StaleTimestamp, "10.0.0.9");

    ASSERT_EQ(lines->size(), 2u);
    EXPECT_NE((*lines)[0].find(R"("event":"host_accepted")"), std::string::npos);
    EXPECT_NE((*lines)[0].find(R"("hostname":"host-a")"), std::string::npos);
    EXPECT_NE((*lines)[0].find(R"("packet_count":3)"), std::string::npos);
    EXPECT_NE((*lines)[1].find(R"("reason":"stale_timestamp")"), std::string::npos);
    EXPECT_NE((*lines)[1].find(R"("from":"10.0.0.9")"), std::string::npos);
}

TEST(DiscoveryMetricsTest, StatusLineListsNonZeroDrops) {
    DiscoveryMetrics metrics;
    EXPECT_EQ(metrics.status_line().find('('), std::string::npos);

    metrics.record_drop(DropReason::QueueFull, "10.0.0.9");
    auto line = metrics.status_line();
    EXPECT_NE(line.find("dropped 1"), std::string::npos);
    EXPECT_NE(line.find("queue_full=1"), std::string::npos);
    EXPECT_EQ(line.find("malformed"), std::string::npos);
}

TEST(DiscoveryMetricsTest, ConcurrentRecording) {
    DiscoveryMetrics metrics;
    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&metrics] {
                for (int i = 0; i < 1000; ++i) {
                    metrics.record_received("10.0.0.1", 100);
                }
            });
        }
    }
    EXPECT_EQ(metrics.summary().datagrams_received, 4000u);
}
