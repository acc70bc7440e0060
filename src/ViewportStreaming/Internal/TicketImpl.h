// SPDX-License-Identifier: MIT
// Internal counterpart of Ticket, shared with the scheduler

#pragma once

#include <ViewportStreaming/Ticket.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace vp_stream {

class TicketImpl : public std::enable_shared_from_this<TicketImpl> {
public:
    explicit TicketImpl(int total) : total_(total), remaining_(total) {}

    int numTasksTotal() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

    int numTasksRemaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return remaining_;
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return remaining_ <= 0; });
    }

    bool waitFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return remaining_ <= 0; });
    }

    /// Called once per task reaching a terminal state.
    void markTaskDone() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (remaining_ > 0) {
                --remaining_;
            }
        }
        cv_.notify_all();
    }

    /// Release all waiters, e.g. when the owning scheduler is disposed.
    void markAllDone() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            remaining_ = 0;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int total_ = 0;
    int remaining_ = 0;
};

}  // namespace vp_stream
