/**
 * Bounded Thread Pool for Collaborator Calls
 *
 * Fixed set of workers fed from one queue. At most num_threads calls run
 * at once and at most max_queued wait behind them; a submission beyond
 * that is refused. Destruction drops queued work and joins the workers,
 * so no call outlives its owner.
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "engram/error.hpp"

namespace engram {

class ThreadPool {
public:
    using Task = std::function<void()>;

    ThreadPool(size_t num_threads, size_t max_queued)
        : num_threads_(std::max<size_t>(1, num_threads)), max_queued_(max_queued) {
        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(&ThreadPool::worker_loop, this);
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
            std::queue<Task>().swap(queue_);
        }
        ready_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    // Throws TransientIOError(POOL_EXHAUSTED) when every worker is busy
    // and the queue is full.
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) {
                throw TransientIOError("thread pool is shutting down", "thread_pool", ErrorCode::POOL_EXHAUSTED);
            }
            if (outstanding_ >= num_threads_ + max_queued_) {
                throw TransientIOError("thread pool saturated: " + std::to_string(outstanding_) +
                                       " calls outstanding", "thread_pool", ErrorCode::POOL_EXHAUSTED);
            }
            ++outstanding_;
            queue_.emplace([task]() { (*task)(); });
        }
        ready_.notify_one();
        return result;
    }

    size_t num_threads() const { return num_threads_; }

    // Queued plus running
    size_t outstanding() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_;
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

private:
    void worker_loop() {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                ready_.wait(lock, [this]() { return stop_ || !queue_.empty(); });
                if (stop_) return;
                task = std::move(queue_.front());
                queue_.pop();
            }

            // packaged_task stores any exception in the future
            task();

            std::lock_guard<std::mutex> lock(mutex_);
            --outstanding_;
        }
    }

    size_t num_threads_;
    size_t max_queued_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::queue<Task> queue_;
    size_t outstanding_ = 0;
    bool stop_ = false;
};

} // namespace engram
