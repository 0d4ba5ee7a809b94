/**
 * @file expiry_sweeper.hpp
 * @brief Periodic liveness sweep over the host registry.
 *
 * Runs independently of network traffic: hosts go inactive even when no
 * datagram ever arrives again.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace lan_beacon {

class HostRegistry;
class Logger;

using ExpiredCallback = std::function<void(const std::vector<HostRecord>&)>;

class ExpirySweeper {
public:
    ExpirySweeper(HostRegistry& registry,
                  Logger& logger,
                  std::chrono::milliseconds check_interval,
                  std::chrono::milliseconds threshold);
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void start();
    void stop();

    /// Run one sweep now. Returns the number of records deactivated.
    size_t sweep_once();

    /// Invoked after a sweep that deactivated at least one record.
    void on_expired(ExpiredCallback callback);

    [[nodiscard]] bool is_running() const noexcept { return thread_.joinable(); }

private:
    void sweep_loop(std::stop_token stop);

    HostRegistry& registry_;
    Logger& logger_;
    std::chrono::milliseconds check_interval_;
    std::chrono::milliseconds threshold_;

    std::jthread thread_;

    std::mutex callback_mutex_;
    std::vector<ExpiredCallback> on_expired_;
};

}  // namespace lan_beacon
