/**
 * @file test_rate_limiter.cpp
 * @brief Unit tests for the per-source admission counter.
 */

#include "protocol/rate_limiter.hpp"

#include <gtest/gtest.h>
#include <chrono>

using namespace lan_beacon;
using namespace std::chrono_literals;

namespace {

const SteadyTime T0 = SteadyTime{} + 1000s;

}  // namespace

TEST(RateLimiterTest, AdmitsUpToLimit) {
    RateLimiter limiter(5, 60s);
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(limiter.allow("192.168.1.10", T0 + std::chrono::seconds(i)));
    }
    EXPECT_FALSE(limiter.allow("192.168.1.10", T0 + 6s));
    EXPECT_FALSE(limiter.allow("192.168.1.10", T0 + 7s));
}

TEST(RateLimiterTest, SourcesCountedIndependently) {
    RateLimiter limiter(2, 60s);
    EXPECT_TRUE(limiter.allow("10.0.0.1", T0));
    EXPECT_TRUE(limiter.allow("10.0.0.1", T0));
    EXPECT_FALSE(limiter.allow("10.0.0.1", T0));

    EXPECT_TRUE(limiter.allow("10.0.0.2", T0));
    EXPECT_EQ(limiter.tracked_sources(), 2u);
}

TEST(RateLimiterTest, WindowResetClearsAllSources) {
    RateLimiter limiter(1, 60s);
    EXPECT_TRUE(limiter.allow("10.0.0.1", T0));
    EXPECT_FALSE(limiter.allow("10.0.0.1", T0 + 30s));
    EXPECT_TRUE(limiter.allow("10.0.0.2", T0 + 59s));

    EXPECT_TRUE(limiter.allow("10.0.0.1", T0 + 60s));
    EXPECT_EQ(limiter.tracked_sources(), 1u);
}

TEST(RateLimiterTest, RejectedDatagramsStillCount) {
    RateLimiter limiter(3, 60s);
    for (int i = 0; i < 3; ++i) ASSERT_TRUE(limiter.allow("10.0.0.1", T0));
    for (int i = 0; i < 10; ++i) EXPECT_FALSE(limiter.allow("10.0.0.1", T0 + 1s));

    // Still refused until the shared window elapses
    EXPECT_FALSE(limiter.allow("10.0.0.1", T0 + 59s));
    EXPECT_TRUE(limiter.allow("10.0.0.1", T0 + 61s));
}

TEST(RateLimiterTest, DefaultsMatchAnnounceCadence) {
    RateLimiter limiter;
    EXPECT_EQ(limiter.limit(), 5u);
}
