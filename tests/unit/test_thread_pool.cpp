/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace node_order;

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

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, CancellableSeesLiveToken) {
    ThreadPool pool(1);
    auto future = pool.submit_cancellable([](std::stop_token stop) {
        return stop.stop_requested();
    });
    EXPECT_FALSE(future.get());
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, ZeroMeansHardwareConcurrency) {
    ThreadPool pool(0);
    EXPECT_GE(pool.thread_count(), 1u);
}

TEST(ThreadPoolTest, QueuedCountWhileWorkerBusy) {
    ThreadPool pool(1);
    std::promise<void> started;
    std::promise<void> release;
    auto gate = release.get_future().share();

    auto blocker = pool.submit([&started, gate] {
        started.set_value();
        gate.wait();
    });
    started.get_future().wait();

    std::vector<std::future<int>> waiting;
    for (int i = 0; i < 3; ++i) {
        waiting.push_back(pool.submit([i] { return i; }));
    }
    EXPECT_EQ(pool.queued_count(), 3u);

    release.set_value();
    blocker.get();
    for (int i = 0; i < 3; ++i) EXPECT_EQ(waiting[static_cast<size_t>(i)].get(), i);
    EXPECT_EQ(pool.queued_count(), 0u);
}
