#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>
#include "interfaces/ILogger.hpp"

namespace core {

/**
 * @brief Fixed-size worker pool for work that must stay off the host thread.
 *
 * Deferred tools hand their long-running part to the pool and return the
 * future to the dispatcher, which polls it from later host ticks. Jobs run
 * in submission order across the workers; a job's result or exception lands
 * in the future returned by submit().
 */
class ThreadPool {
public:
    /**
     * @param num_threads Worker count (0 is raised to 1)
     * @param logger      Optional; receives start/stop lines
     */
    explicit ThreadPool(size_t num_threads = 2,
                        std::shared_ptr<interfaces::ILogger> logger = nullptr)
        : logger_(std::move(logger)) {
        const size_t count = num_threads == 0 ? 1 : num_threads;
        workers_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            workers_.emplace_back(&ThreadPool::worker_loop, this);
        }
        if (logger_) {
            logger_->info("[WorkerPool] Started " + std::to_string(count) + " workers");
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue `job`. After shutdown() the returned future already holds
     * a std::runtime_error.
     */
    template <typename F, typename R = std::invoke_result_t<std::decay_t<F>>>
    std::future<R> submit(F&& job) {
        auto promise = std::make_shared<std::promise<R>>();
        std::future<R> result = promise->get_future();

        std::unique_lock<std::mutex> lock(mutex_);
        if (!accepting_) {
            lock.unlock();
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error("ThreadPool is shut down")));
            return result;
        }

        queue_.emplace_back([job = std::forward<F>(job), promise]() mutable {
            try {
                if constexpr (std::is_void_v<R>) {
                    job();
                    promise->set_value();
                } else {
                    promise->set_value(job());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
        lock.unlock();

        work_available_.notify_one();
        return result;
    }

    /**
     * @brief Refuse new jobs, let the workers finish everything queued, then
     * join them. Idempotent.
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!accepting_) return;
            accepting_ = false;
        }
        work_available_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }

        if (logger_) {
            logger_->info("[WorkerPool] Stopped after " + std::to_string(completed_.load()) + " jobs");
        }
    }

    // Jobs waiting for a worker
    size_t pending_tasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    // Jobs currently running
    size_t active_tasks() const { return active_.load(); }

    size_t num_workers() const { return workers_.size(); }

private:
    void worker_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            work_available_.wait(lock, [this]() { return !accepting_ || !queue_.empty(); });
            if (queue_.empty()) return;   // shut down and drained

            std::function<void()> job = std::move(queue_.front());
            queue_.pop_front();
            active_++;
            lock.unlock();

            job();

            lock.lock();
            active_--;
            completed_++;
        }
    }

    std::shared_ptr<interfaces::ILogger> logger_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::deque<std::function<void()>> queue_;
    bool accepting_ = true;

    std::atomic<size_t> active_{0};
    std::atomic<uint64_t> completed_{0};
};

} // namespace core
