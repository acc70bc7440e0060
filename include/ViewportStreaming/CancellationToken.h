#pragma once

#include "ViewportStreaming/Types.h"

#include <atomic>
#include <memory>

namespace vp_stream {

/// Cooperative abort signal shared between a scheduler and the work it dispatched.
/// Copies share state; cancelling any copy cancels all of them.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    /// Request cancellation. Idempotent.
    void cancel() { state_->cancelled.store(true, std::memory_order_release); }

    /// Arm a deadline after which the token reports expiry.
    void setDeadline(TimePoint deadline) {
        state_->deadlineNs.store(deadline.time_since_epoch().count(), std::memory_order_release);
    }

    bool cancellationRequested() const {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    bool deadlineExpired() const {
        auto ns = state_->deadlineNs.load(std::memory_order_acquire);
        if (ns == kNoDeadline) return false;
        return Clock::now().time_since_epoch().count() >= ns;
    }

    /// True when either cancelled or past the deadline. Item loaders should poll this.
    bool isCancelled() const { return cancellationRequested() || deadlineExpired(); }

private:
    static constexpr Clock::rep kNoDeadline = 0;

    struct State {
        std::atomic<bool> cancelled{false};
        std::atomic<Clock::rep> deadlineNs{kNoDeadline};
    };

    std::shared_ptr<State> state_;
};

} // namespace vp_stream
