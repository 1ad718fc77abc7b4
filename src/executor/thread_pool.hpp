/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool for independent document conversions.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace lineproto_csv {

/**
 * @brief Fixed-size pool of std::jthread workers.
 *
 * Work queued before destruction is still run: the destructor stops the
 * workers only once the queue is empty, so no returned future is left
 * without a value.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a callable; its result or exception arrives through the future.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(func));
    auto future = task->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push([task] { (*task)(); });
    }
    queue_cv_.notify_one();
    return future;
}

}  // namespace lineproto_csv
