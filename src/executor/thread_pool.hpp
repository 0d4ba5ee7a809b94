/**
 * @file thread_pool.hpp
 * @brief std::jthread-based thread pool with a bounded task queue.
 *
 * The receive loop must never block on storage, so producers use
 * try_submit() and treat a full queue as a drop. Neither entry point
 * ever blocks the caller.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace lan_beacon {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 *
 * Tasks still queued when the pool is destroyed are discarded.
 */
class ThreadPool {
public:
    static constexpr size_t UNBOUNDED = 0;

    explicit ThreadPool(size_t num_threads = 0, size_t capacity = UNBOUNDED);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueue a fire-and-forget task.
     * @return false if the queue is at capacity or the pool is shutting down.
     */
    template <std::invocable F>
    [[nodiscard]] bool try_submit(F&& func);

    /**
     * @brief Enqueue a task and obtain its result.
     * @return std::nullopt if the queue is at capacity.
     */
    template <std::invocable F>
    std::optional<std::future<std::invoke_result_t<F>>> submit(F&& func);

    /// Stop accepting work, drop queued tasks and join the workers.
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    using Task = std::function<void(std::stop_token)>;

    bool enqueue(Task task);
    void worker_loop(std::stop_token stop);

    size_t capacity_;
    std::vector<std::jthread> workers_;
    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
    bool accepting_{true};
};

// ── Template implementations ─────────────────

template <std::invocable F>
bool ThreadPool::try_submit(F&& func) {
    return enqueue([f = std::forward<F>(func)](std::stop_token) mutable { f(); });
}

template <std::invocable F>
std::optional<std::future<std::invoke_result_t<F>>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    bool queued = enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });

    if (!queued) return std::nullopt;
    return future;
}

}  // namespace lan_beacon
