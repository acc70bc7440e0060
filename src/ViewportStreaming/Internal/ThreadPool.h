// SPDX-License-Identifier: MIT
// Fixed-size worker pool for chunk loads and background viewport preloads

#pragma once

#include <ViewportStreaming/Logging.h>

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace vp_stream {
namespace internal {

/// A fixed number of worker threads that process tasks from a FIFO queue.
/// Tasks must not throw; anything that escapes is logged and dropped so a
/// faulty collaborator cannot take a worker down.
class ThreadPool {
public:
    explicit ThreadPool(unsigned int numThreads = 0, const char* name = "pool") : name_(name) {
        if (numThreads == 0) {
            numThreads = std::max(1u, std::thread::hardware_concurrency());
        }
        numThreads = std::min(numThreads, 32u);

        for (unsigned int i = 0; i < numThreads; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ~ThreadPool() { shutdown(); }

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// Submit a task. Returns false once the pool is shutting down.
    bool submit(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return false;
            }
            tasks_.push(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    /// Wait for all currently submitted tasks to complete
    void waitAll() {
        std::unique_lock<std::mutex> lock(mutex_);
        completionCv_.wait(lock, [this] {
            return tasks_.empty() && activeWorkers_ == 0;
        });
    }

    /// Stop accepting tasks, drain the queue and join the workers. Idempotent.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ && workers_.empty()) {
                return;
            }
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                if (worker.get_id() == std::this_thread::get_id()) {
                    worker.detach();
                } else {
                    worker.join();
                }
            }
        }
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.clear();
    }

    /// Get number of worker threads
    unsigned int size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<unsigned int>(workers_.size());
    }

    /// Tasks queued but not yet picked up by a worker
    size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });

                if (stopping_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
                ++activeWorkers_;
            }

            try {
                task();
            } catch (const std::exception& e) {
                logMessage(LogLevel::Error, "%s: task threw: %s", name_, e.what());
            } catch (...) {
                logMessage(LogLevel::Error, "%s: task threw a non-standard exception", name_);
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --activeWorkers_;
            }
            completionCv_.notify_all();
        }
    }

    const char* name_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable completionCv_;
    unsigned int activeWorkers_ = 0;
    bool stopping_ = false;
};

} // namespace internal
} // namespace vp_stream
