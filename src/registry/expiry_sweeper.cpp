/**
 * @file expiry_sweeper.cpp
 * @brief ExpirySweeper implementation.
 */

#include "registry/expiry_sweeper.hpp"

#include "core/logger.hpp"
#include "registry/host_registry.hpp"

namespace lan_beacon {

ExpirySweeper::ExpirySweeper(HostRegistry& registry,
                             Logger& logger,
                             std::chrono::milliseconds check_interval,
                             std::chrono::milliseconds threshold)
    : registry_(registry)
    , logger_(logger)
    , check_interval_(check_interval)
    , threshold_(threshold) {}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stop) {
        sweep_loop(stop);
    });
}

void ExpirySweeper::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

void ExpirySweeper::on_expired(ExpiredCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_expired_.push_back(std::move(callback));
}

size_t ExpirySweeper::sweep_once() {
    auto expired = registry_.expire_stale(threshold_);
    if (!expired) {
        logger_.error("Expiry sweep failed: " + expired.error().message);
        return 0;
    }
    if (expired->empty()) return 0;

    for (const auto& record : *expired) {
        logger_.info("Host inactive: " + record.metadata.mac_address
                     + " (" + record.metadata.hostname + ")");
    }

    std::lock_guard lock(callback_mutex_);
    for (const auto& cb : on_expired_) {
        cb(*expired);
    }
    return expired->size();
}

void ExpirySweeper::sweep_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        sweep_once();

        // Sleep in small increments to respond to stop requests promptly
        auto deadline = std::chrono::steady_clock::now() + check_interval_;
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
}

}  // namespace lan_beacon
