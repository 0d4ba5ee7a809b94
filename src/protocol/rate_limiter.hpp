/**
 * @file rate_limiter.hpp
 * @brief Per-source admission counter with a single shared reset window.
 *
 * All counters are cleared together when the window elapses, so a burst
 * right after a reset is admitted for every source at once.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace lan_beacon {

class RateLimiter {
public:
    explicit RateLimiter(uint32_t limit = 5,
                         std::chrono::milliseconds window = std::chrono::seconds(60));

    /**
     * @brief Count one datagram from @p source and decide whether to admit it.
     *
     * The counter is incremented before the check, so rejected datagrams
     * still count against the source until the next reset.
     */
    [[nodiscard]] bool allow(const std::string& source, SteadyTime now);

    [[nodiscard]] size_t tracked_sources() const;
    [[nodiscard]] uint32_t limit() const noexcept { return limit_; }

private:
    uint32_t limit_;
    std::chrono::milliseconds window_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint32_t> counts_;
    std::optional<SteadyTime> next_reset_;
};

}  // namespace lan_beacon
