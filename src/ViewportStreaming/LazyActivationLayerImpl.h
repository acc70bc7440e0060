// SPDX-License-Identifier: MIT
// Internal implementation header for LazyActivationLayer

#pragma once

#include <ViewportStreaming/LazyActivationLayer.h>
#include "Internal/EventHub.h"
#include "Internal/ThreadPool.h"
#include "Internal/TimerQueue.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <vector>

namespace vp_stream {

/// Implementation class for LazyActivationLayer (PIMPL pattern)
class LazyActivationLayer::Impl {
public:
    Impl(const ActivationOptions& options, std::shared_ptr<ViewportMaterializer> materializer,
         std::shared_ptr<ViewportPool> pool);
    ~Impl();

    // Non-copyable
    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    bool registerViewport(const std::string& viewportId, const ViewportMetadata& metadata);
    bool unregisterViewport(const std::string& viewportId);
    bool activateViewport(const std::string& viewportId, SurfaceHandle surface, bool immediate);
    bool deactivateViewport(const std::string& viewportId);
    bool preloadViewport(const std::string& viewportId);
    ViewportInfo getViewportState(const std::string& viewportId) const;
    std::vector<std::string> getActiveViewports() const;
    std::vector<std::string> getLoadingQueue() const;
    MemoryUsage getMemoryUsage() const;
    std::vector<ViewportPrediction> predictNextViewports() const;
    LoadingError getLastError() const;
    void setViewportPriority(const std::string& viewportId, int priority);
    void setPredictiveLoading(bool enabled);
    bool isPredictiveLoadingEnabled() const;
    SubscriptionId subscribe(std::function<void(const ActivationEvent&)> listener);
    bool unsubscribe(SubscriptionId id);
    void dispose();
    bool isDisposed() const;

private:
    struct Instance {
        std::string id;
        uint64_t serial = 0;                 // distinguishes re-registrations of one id
        ViewportState state = ViewportState::Uninitialized;
        TimePoint lastAccessTime{};
        uint64_t accessCount = 0;
        int priority = 0;
        bool preloaded = false;
        SurfaceHandle surface = nullptr;
        ViewportHandle slot;
        ViewportMetadata metadata;
        internal::TimerQueue::TimerId inactivityTimer = internal::TimerQueue::kInvalidTimer;
        uint64_t timerGeneration = 0;
    };

    enum class Origin {
        Caller,
        Preload
    };

    using EventList = std::vector<ActivationEvent>;

    // Backend work collected under mutex_ and run after it is released
    struct Teardown {
        std::string viewportId;
        bool dematerialize = true;
        ViewportHandle slot;
    };
    using TeardownList = std::vector<Teardown>;

    // Run the materialization for an instance already marked Initializing
    bool materialize(const std::string& viewportId, uint64_t serial, SurfaceHandle surface, Origin origin);

    // Helpers (require mutex_ held)
    Instance* findLocked(const std::string& viewportId);
    const Instance* findLocked(const std::string& viewportId) const;
    size_t activeCountLocked() const;
    bool canActivateLocked() const;
    void freeUpResourcesLocked(EventList& events, TeardownList& teardowns);
    void deactivateLocked(Instance& instance, EventList& events, TeardownList& teardowns);
    void teardownLocked(Instance& instance, TeardownList& teardowns);
    void scheduleTeardownLocked(Teardown teardown, TeardownList& teardowns);
    void touchLocked(Instance& instance, bool recordHistory);
    void armInactivityTimerLocked(Instance& instance);
    void clearInactivityTimerLocked(Instance& instance);

    // Timer callbacks
    void handleInactive(const std::string& viewportId, uint64_t generation);
    void analyzePredictivePatterns();
    void checkMemory();
    void schedulePreload(const std::string& viewportId, std::chrono::milliseconds delay);
    void scheduleAdjacentPreloads(const std::string& viewportId);

    // Requires mutex_ released
    void runTeardowns(const TeardownList& teardowns);
    void emitAll(const EventList& events);

    ActivationOptions options_;
    std::shared_ptr<ViewportMaterializer> materializer_;
    std::shared_ptr<ViewportPool> pool_;

    mutable std::mutex mutex_;
    std::condition_variable stateCv_;      // signalled whenever an activation leaves Initializing
    std::map<std::string, Instance> instances_;
    std::deque<std::string> accessHistory_;
    std::map<std::string, size_t> teardownsInFlight_;  // ids whose backend teardown has not finished
    uint64_t nextSerial_ = 1;
    bool disposed_ = false;
    LoadingError lastError_ = LoadingError::Success;
    std::atomic<bool> predictiveEnabled_;

    internal::EventHub<ActivationEvent> events_;
    internal::ThreadPool workers_;
    internal::TimerQueue timers_;
};

} // namespace vp_stream
