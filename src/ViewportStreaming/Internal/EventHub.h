// SPDX-License-Identifier: MIT
// Listener registry shared by the pool, activation layer and scheduler

#pragma once

#include <ViewportStreaming/Logging.h>

#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace vp_stream {
namespace internal {

template <typename Event>
class EventHub {
public:
    using Listener = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    explicit EventHub(const char* owner) : owner_(owner) {}

    SubscriptionId subscribe(Listener listener) {
        if (!listener) return 0;
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = nextId_++;
        listeners_.emplace_back(id, std::move(listener));
        return id;
    }

    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
            if (it->first == id) {
                listeners_.erase(it);
                return true;
            }
        }
        return false;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.clear();
    }

    /// Deliver to a snapshot of the listeners. Must be called without
    /// component locks held; listeners may call back into the component.
    void emit(const Event& event) const {
        std::vector<std::pair<SubscriptionId, Listener>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (listeners_.empty()) return;
            snapshot = listeners_;
        }
        for (const auto& entry : snapshot) {
            try {
                entry.second(event);
            } catch (const std::exception& e) {
                logMessage(LogLevel::Warn, "%s: listener %llu threw: %s", owner_,
                           static_cast<unsigned long long>(entry.first), e.what());
            } catch (...) {
                logMessage(LogLevel::Warn, "%s: listener %llu threw a non-standard exception", owner_,
                           static_cast<unsigned long long>(entry.first));
            }
        }
    }

private:
    const char* owner_;
    mutable std::mutex mutex_;
    std::vector<std::pair<SubscriptionId, Listener>> listeners_;
    SubscriptionId nextId_ = 1;
};

} // namespace internal
} // namespace vp_stream
