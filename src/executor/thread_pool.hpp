/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool used to score candidate nodes in parallel.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace node_order {

/**
 * @brief Fixed-size pool; queued work still pending at destruction is dropped.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that observes the pool's stop_token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void enqueue(std::function<void(std::stop_token)> job);
    void worker_loop(std::stop_token stop);

    std::queue<std::function<void(std::stop_token)>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::vector<std::jthread> workers_;   // last: joined before the queue is torn down
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    return submit_cancellable(
        [f = std::forward<F>(func)](std::stop_token) mutable { return f(); });
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token stop) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(stop);
                p->set_value();
            } else {
                p->set_value(f(stop));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    return future;
}

}  // namespace node_order
