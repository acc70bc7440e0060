// SPDX-License-Identifier: MIT
// Internal implementation header for ViewportPool

#pragma once

#include <ViewportStreaming/ViewportPool.h>
#include "Internal/EventHub.h"
#include "Internal/TimerQueue.h"

#include <deque>
#include <map>
#include <mutex>
#include <vector>

namespace vp_stream {

/// Implementation class for ViewportPool (PIMPL pattern)
class ViewportPool::Impl {
public:
    Impl(const ViewportPoolOptions& options, std::shared_ptr<SlotBackend> backend,
         std::shared_ptr<PressureSource> pressure);
    ~Impl();

    // Non-copyable
    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    ViewportHandle acquire(ContentType type, const std::string& contentId);
    bool release(uint32_t poolId);
    GarbageCollectionResult runGarbageCollection();
    bool checkMemoryPressure();
    PooledViewport getSlot(uint32_t poolId) const;
    std::vector<PooledViewport> getSlots() const;
    size_t size() const;
    size_t estimateMemoryUsage() const;
    PoolStatistics getStatistics() const;
    PoolHealth getHealthStatus() const;
    const ViewportPoolOptions& getOptions() const { return options_; }
    LoadingError getLastError() const;
    SubscriptionId subscribe(std::function<void(const PoolEvent&)> listener);
    bool unsubscribe(SubscriptionId id);
    void dispose();
    bool isDisposed() const;

private:
    struct Slot {
        uint32_t poolId = 0;
        SlotState state = SlotState::Available;
        ContentType type = ContentType::Stack;
        TimePoint createdAt{};
        TimePoint lastUsedAt{};
        uint64_t usageCount = 0;
        std::string contentId;
        std::string lastContentId;      // content held before release, for fast reclaim
        SlotResources resources{};
        internal::TimerQueue::TimerId cleanupTimer = internal::TimerQueue::kInvalidTimer;
        uint64_t cleanupGeneration = 0;  // bumped on every release
    };

    using EventList = std::vector<PoolEvent>;

    // Slot management (require mutex_ held)
    Slot* createSlotLocked(ContentType type);
    void removeSlotLocked(uint32_t poolId, EventList& events, std::vector<std::string>* errors);
    Slot* findAvailableLocked(ContentType type);
    Slot* findReclaimableLocked(ContentType type, const std::string& contentId);
    Slot* recycleLocked(ContentType type, EventList& events);
    bool shouldExpandLocked() const;
    bool contentInUseLocked(const std::string& contentId) const;
    void markInUseLocked(Slot& slot, const std::string& contentId);
    void resetSlotLocked(Slot& slot, ContentType type);
    size_t countStateLocked(SlotState state) const;
    size_t estimateMemoryLocked() const;
    double efficiencyLocked() const;
    GarbageCollectionResult collectLocked(EventList& events);
    size_t aggressiveCleanupLocked(EventList& events);

    // Deferred cleanup, runs on the timer thread
    void completeCleanup(uint32_t poolId, uint64_t generation);

    void emitAll(const EventList& events);
    static PoolEvent makeEvent(PoolEventType type, const Slot& slot);
    static PooledViewport snapshot(const Slot& slot);

    ViewportPoolOptions options_;
    std::shared_ptr<SlotBackend> backend_;
    MemoryMonitor memory_;

    mutable std::mutex mutex_;
    std::map<uint32_t, Slot> slots_;
    std::deque<uint32_t> availableQueue_;   // FIFO by the time a slot became available
    uint32_t nextPoolId_ = 1;
    bool disposed_ = false;
    LoadingError lastError_ = LoadingError::Success;

    uint64_t recycleCount_ = 0;
    uint64_t reclaimCount_ = 0;
    uint64_t disposedCount_ = 0;
    uint64_t gcRunCount_ = 0;
    TimePoint lastGcTime_{};

    internal::EventHub<PoolEvent> events_;
    internal::TimerQueue timers_;
};

} // namespace vp_stream
