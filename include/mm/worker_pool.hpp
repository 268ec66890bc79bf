#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace mm {

// Fixed set of threads that blocking venue work is off-loaded to.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t num_threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    template <typename F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F>> {
        using return_type = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> result = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("enqueue on stopped WorkerPool");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        condition_.notify_one();
        return result;
    }

    [[nodiscard]] std::size_t thread_count() const noexcept { return workers_.size(); }
    [[nodiscard]] std::size_t pending_tasks() const;

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

// Counting semaphore capping simultaneous outbound calls.
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(std::size_t limit);

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    class Permit {
    public:
        explicit Permit(ConcurrencyLimiter& limiter) : limiter_(&limiter) { limiter_->acquire(); }
        ~Permit() {
            if (limiter_) {
                limiter_->release();
            }
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& other) noexcept : limiter_(other.limiter_) { other.limiter_ = nullptr; }
        Permit& operator=(Permit&&) = delete;

    private:
        ConcurrencyLimiter* limiter_;
    };

    [[nodiscard]] Permit acquire_permit() { return Permit(*this); }

    void acquire();
    void release();

    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }
    [[nodiscard]] std::size_t in_flight() const;
    [[nodiscard]] std::size_t peak_in_flight() const;

private:
    const std::size_t limit_;
    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::size_t in_flight_ = 0;
    std::size_t peak_ = 0;
};

} // namespace mm
