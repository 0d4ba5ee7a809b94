/**
 * @file rate_limiter.cpp
 * @brief RateLimiter implementation.
 */

#include "protocol/rate_limiter.hpp"

namespace lan_beacon {

RateLimiter::RateLimiter(uint32_t limit, std::chrono::milliseconds window)
    : limit_(limit), window_(window) {}

bool RateLimiter::allow(const std::string& source, SteadyTime now) {
    std::lock_guard lock(mutex_);

    if (!next_reset_ || now >= *next_reset_) {
        counts_.clear();
        next_reset_ = now + window_;
    }

    auto& count = counts_[source];
    ++count;
    return count <= limit_;
}

size_t RateLimiter::tracked_sources() const {
    std::lock_guard lock(mutex_);
    return counts_.size();
}

}  // namespace lan_beacon
