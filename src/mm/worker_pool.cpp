#include "mm/worker_pool.hpp"

#include <algorithm>
#include <iostream>

namespace mm {

WorkerPool::WorkerPool(std::size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 4;
        }
    }

    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex_);
                    condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                    if (stop_ && tasks_.empty()) {
                        return;
                    }
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                // packaged_task stores any exception in its future.
                task();
            }
        });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
}

std::size_t WorkerPool::pending_tasks() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

ConcurrencyLimiter::ConcurrencyLimiter(std::size_t limit)
    : limit_(std::max<std::size_t>(limit, 1)) {}

void ConcurrencyLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    released_.wait(lock, [this] { return in_flight_ < limit_; });
    ++in_flight_;
    peak_ = std::max(peak_, in_flight_);
}

void ConcurrencyLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ == 0) {
            std::cerr << "[Loop] ConcurrencyLimiter released more than acquired" << std::endl;
            return;
        }
        --in_flight_;
    }
    released_.notify_one();
}

std::size_t ConcurrencyLimiter::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::size_t ConcurrencyLimiter::peak_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

} // namespace mm
