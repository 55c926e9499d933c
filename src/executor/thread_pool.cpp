/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

namespace node_order {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    workers_.clear();
}

void ThreadPool::enqueue(std::function<void(std::stop_token)> job) {
    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
}

void ThreadPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::function<void(std::stop_token)> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            if (stop.stop_requested() || task_queue_.empty()) return;

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        task(stop);
    }
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace node_order
