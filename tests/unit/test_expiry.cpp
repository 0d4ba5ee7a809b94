/**
 * @file test_expiry.cpp
 * @brief Unit tests for the periodic expiry sweeper.
 */

#include "core/logger.hpp"
#include "registry/expiry_sweeper.hpp"
#include "registry/host_registry.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace lan_beacon;
using namespace std::chrono_literals;

class ExpirySweeperTest : public ::testing::Test {
protected:
    std::shared_ptr<std::atomic<int64_t>> now_ms_ =
        std::make_shared<std::atomic<int64_t>>(1718000000000);
    Logger logger_{std::make_unique<NullSink>()};
    std::unique_ptr<HostRegistry> registry_;

    void SetUp() override {
        auto now = now_ms_;
        auto opened = HostRegistry::open(":memory:", &logger_,
                                         [now] { return from_unix_millis(now->load()); });
        ASSERT_TRUE(opened.has_value()) << opened.error().message;
        registry_ = std::move(*opened);
    }

    void upsert(const std::string& mac) {
        HostMetadata m;
        m.timestamp = 1718000000;
        m.mac_address = mac;
        m.ip_address = "192.168.1.10";
        m.hostname = "host-" + mac.substr(mac.size() - 2);
        ASSERT_TRUE(registry_->upsert(m).has_value());
    }

    void advance(std::chrono::milliseconds delta) {
        now_ms_->fetch_add(delta.count());
    }

    template <typename Pred>
    static bool wait_for(Pred pred, std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred()) {
            if (std::chrono::steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(10ms);
        }
        return true;
    }
};

TEST_F(ExpirySweeperTest, SweepOnceDeactivatesStaleHosts) {
    upsert("aa:bb:cc:dd:ee:01");
    advance(60s);
    upsert("aa:bb:cc:dd:ee:02");
    advance(40s);

    ExpirySweeper sweeper(*registry_, logger_, 1s, 90s);
    EXPECT_EQ(sweeper.sweep_once(), 1u);

    auto active = registry_->get_active();
    ASSERT_TRUE(active.has_value());
    ASSERT_EQ(active->size(), 1u);
    EXPECT_EQ(active->front().metadata.mac_address, "aa:bb:cc:dd:ee:02");

    EXPECT_EQ(sweeper.sweep_once(), 0u);
}

TEST_F(ExpirySweeperTest, CallbackReceivesExpiredRecords) {
    upsert("aa:bb:cc:dd:ee:01");
    advance(120s);

    ExpirySweeper sweeper(*registry_, logger_, 1s, 90s);
    std::vector<HostRecord> seen;
    int calls = 0;
    sweeper.on_expired([&](const std::vector<HostRecord>& expired) {
        ++calls;
        seen = expired;
    });

    sweeper.sweep_once();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_FALSE(seen.front().active);
    EXPECT_EQ(seen.front().metadata.mac_address, "aa:bb:cc:dd:ee:01");

    // No callback for a sweep that changes nothing
    sweeper.sweep_once();
    EXPECT_EQ(calls, 1);
}

TEST_F(ExpirySweeperTest, BackgroundLoopExpiresWithoutTraffic) {
    upsert("aa:bb:cc:dd:ee:01");

    ExpirySweeper sweeper(*registry_, logger_, 50ms, 90s);
    std::atomic<size_t> expired_count{0};
    sweeper.on_expired([&](const std::vector<HostRecord>& expired) {
        expired_count += expired.size();
    });

    sweeper.start();
    EXPECT_TRUE(sweeper.is_running());

    advance(91s);
    EXPECT_TRUE(wait_for([&] { return expired_count.load() == 1; }));
    EXPECT_TRUE(registry_->get_active()->empty());

    sweeper.stop();
    EXPECT_FALSE(sweeper.is_running());
}

TEST_F(ExpirySweeperTest, StopIsPromptAndIdempotent) {
    ExpirySweeper sweeper(*registry_, logger_, 1h, 90s);
    sweeper.start();

    auto before = std::chrono::steady_clock::now();
    sweeper.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);

    sweeper.stop();
    EXPECT_FALSE(sweeper.is_running());
}
