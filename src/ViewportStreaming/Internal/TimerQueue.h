// SPDX-License-Identifier: MIT
// Single-threaded timer dispatcher for deferred and periodic work

#pragma once

#include <ViewportStreaming/Logging.h>
#include <ViewportStreaming/Types.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace vp_stream {
namespace internal {

/// Runs callbacks after a delay, or repeatedly on an interval, on one
/// dispatcher thread. Callbacks run without the queue lock held, so they may
/// schedule or cancel other timers. A callback never overlaps with itself.
class TimerQueue {
public:
    using TimerId = uint64_t;
    static constexpr TimerId kInvalidTimer = 0;

    explicit TimerQueue(const char* name = "timers") : name_(name) {
        thread_ = std::thread([this] { dispatchLoop(); });
    }

    ~TimerQueue() { shutdown(); }

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    /// Run fn once after delay. Returns kInvalidTimer after shutdown.
    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> fn) {
        return add(delay, std::chrono::milliseconds(0), std::move(fn));
    }

    /// Run fn every interval, first run one interval from now.
    TimerId scheduleRepeating(std::chrono::milliseconds interval, std::function<void()> fn) {
        interval = std::max(interval, std::chrono::milliseconds(1));
        return add(interval, interval, std::move(fn));
    }

    /// Cancel a pending timer. Returns false if it already fired (one-shot) or is unknown.
    bool cancel(TimerId id) {
        if (id == kInvalidTimer) return false;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        removeFromOrderLocked(it->second.due, id);
        entries_.erase(it);
        cv_.notify_all();
        return true;
    }

    /// Drop all pending timers and join the dispatcher. Idempotent.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ && !thread_.joinable()) {
                return;
            }
            stopping_ = true;
            entries_.clear();
            order_.clear();
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            if (thread_.get_id() == std::this_thread::get_id()) {
                // Shut down from inside a callback: the loop exits once it returns
                thread_.detach();
            } else {
                thread_.join();
            }
        }
    }

    size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        TimePoint due;
        std::chrono::milliseconds interval{0};
        std::function<void()> fn;
    };

    TimerId add(std::chrono::milliseconds delay, std::chrono::milliseconds interval,
                std::function<void()> fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return kInvalidTimer;
        }
        TimerId id = nextId_++;
        TimePoint due = Clock::now() + std::max(delay, std::chrono::milliseconds(0));
        entries_.emplace(id, Entry{due, interval, std::move(fn)});
        order_.emplace(due, id);
        cv_.notify_all();
        return id;
    }

    void removeFromOrderLocked(TimePoint due, TimerId id) {
        auto range = order_.equal_range(due);
        for (auto it = range.first; it != range.second; ++it) {
            if (it->second == id) {
                order_.erase(it);
                return;
            }
        }
    }

    void dispatchLoop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_) {
            if (order_.empty()) {
                cv_.wait(lock);
                continue;
            }
            TimePoint due = order_.begin()->first;
            if (Clock::now() < due) {
                cv_.wait_until(lock, due);
                continue;
            }

            TimerId id = order_.begin()->second;
            order_.erase(order_.begin());
            auto it = entries_.find(id);
            if (it == entries_.end()) {
                continue;
            }

            std::function<void()> fn;
            if (it->second.interval.count() > 0) {
                // Re-arm before running so cancel() from the callback wins
                it->second.due = Clock::now() + it->second.interval;
                order_.emplace(it->second.due, id);
                fn = it->second.fn;
            } else {
                fn = std::move(it->second.fn);
                entries_.erase(it);
            }

            lock.unlock();
            try {
                fn();
            } catch (const std::exception& e) {
                logMessage(LogLevel::Error, "%s: timer callback threw: %s", name_, e.what());
            } catch (...) {
                logMessage(LogLevel::Error, "%s: timer callback threw a non-standard exception", name_);
            }
            lock.lock();
        }
    }

    const char* name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<TimerId, Entry> entries_;
    std::multimap<TimePoint, TimerId> order_;
    TimerId nextId_ = 1;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace internal
} // namespace vp_stream
