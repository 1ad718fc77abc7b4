/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace lineproto_csv;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(2);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, QueuedWorkRunsBeforeShutdown) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    {
        ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            futures.push_back(pool.submit([&counter] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                counter.fetch_add(1, std::memory_order_relaxed);
            }));
        }
    }
    EXPECT_EQ(counter.load(), 20);
    for (auto& f : futures) {
        EXPECT_EQ(f.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    }
}

TEST(ThreadPoolTest, CountsActiveAndQueuedWork) {
    ThreadPool pool(1);
    std::promise<void> release;
    auto gate = release.get_future().share();

    auto blocker = pool.submit([gate] { gate.wait(); });

    // Wait for the single worker to pick up the blocking task.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (pool.active_count() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_EQ(pool.active_count(), 1u);

    auto second = pool.submit([] { return 1; });
    auto third = pool.submit([] { return 2; });
    EXPECT_EQ(pool.queued_count(), 2u);
    EXPECT_EQ(pool.active_count(), 1u);

    release.set_value();
    blocker.get();
    EXPECT_EQ(second.get(), 1);
    EXPECT_EQ(third.get(), 2);
    EXPECT_EQ(pool.queued_count(), 0u);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, ZeroMeansHardwareConcurrency) {
    ThreadPool pool(0);
    EXPECT_GE(pool.thread_count(), 1u);
}
