#pragma once

#include "ViewportStreaming/Monitors.h"
#include "ViewportStreaming/Types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vp_stream {

/// Rendering resources behind a pool slot, supplied by the rendering engine.
/// Called with the pool lock held: implementations must not call back into the pool.
/// Exceptions are caught and logged by the pool.
class SlotBackend {
public:
    virtual ~SlotBackend() = default;

    /// Allocate resources for a new slot.
    virtual SlotResources createSlot(uint32_t poolId, ContentType type) = 0;

    /// Tear down content so the slot can be reused, possibly for another type.
    virtual void resetSlot(uint32_t poolId, ContentType type, SlotResources& resources) = 0;

    /// Free the slot for good.
    virtual void destroySlot(uint32_t poolId, SlotResources& resources) = 0;
};

enum class SlotState {
    Available = 0,
    InUse,
    PendingCleanup,
    Disposed
};

const char* slotStateName(SlotState state);

// Configuration options
struct ViewportPoolOptions {
    size_t minPoolSize = 2;
    size_t maxPoolSize = 16;
    size_t initialPoolSize = 4;
    double expandThreshold = 0.8;     // utilization at which acquire may grow the pool
    double shrinkThreshold = 0.2;     // utilization at or below which GC shrinks the pool
    std::chrono::milliseconds gcInterval{60000};
    std::chrono::milliseconds maxIdleTime{300000};
    std::chrono::milliseconds cleanupDelay{1000};
    std::chrono::milliseconds memoryCheckInterval{30000};
    size_t maxMemoryUsage = 1024ULL * 1024 * 1024;   // 1 GB
    size_t bytesPerViewport = 50ULL * 1024 * 1024;   // 50 MB estimate
    double pressureThreshold = 0.9;   // PressureSource reading that triggers burst cleanup
    bool enableAutoScaling = true;
    bool enableGarbageCollection = true;
};

/// Snapshot of one pool slot
struct PooledViewport {
    uint32_t poolId = 0;
    bool valid = false;
    SlotState state = SlotState::Disposed;
    ContentType type = ContentType::Stack;
    TimePoint createdAt{};
    TimePoint lastUsedAt{};           // epoch when never used
    uint64_t usageCount = 0;
    std::string contentId;            // set only while in use
    SlotResources resources{};
};

struct PoolStatistics {
    size_t totalViewports = 0;
    size_t availableViewports = 0;
    size_t inUseViewports = 0;
    size_t pendingCleanup = 0;
    uint64_t recycleCount = 0;        // available slots re-tagged for another type
    uint64_t reclaimCount = 0;        // pending-cleanup slots reused for the same content
    uint64_t disposedCount = 0;       // slots removed by GC, shrink or burst cleanup
    uint64_t gcRunCount = 0;
    size_t memoryUsage = 0;           // estimate in bytes
    TimePoint lastGcTime{};
    double poolEfficiency = 100.0;    // % of reuse among reuse + disposal
};

struct GarbageCollectionResult {
    size_t cleanedViewports = 0;
    size_t freedMemory = 0;
    std::chrono::milliseconds duration{0};
    std::vector<std::string> errors;
};

struct PoolHealth {
    bool healthy = true;
    std::vector<std::string> issues;
    std::vector<std::string> recommendations;
};

enum class PoolEventType {
    Acquired = 0,
    Released,
    Recycled,
    CleanupCompleted,
    Removed,
    GcCompleted
};

struct PoolEvent {
    PoolEventType type = PoolEventType::Acquired;
    uint32_t poolId = 0;
    ContentType contentType = ContentType::Stack;
    std::string contentId;
    GarbageCollectionResult gc;       // GcCompleted only
};

/// Elastic pool of reusable viewport slots.
///
/// acquire() hands out a slot bound to one content id; release() returns it
/// through a short pending-cleanup phase. Periodic garbage collection removes
/// idle slots and shrinks an underused pool. All methods are thread-safe.
class ViewportPool {
public:
    using SubscriptionId = uint64_t;

    explicit ViewportPool(const ViewportPoolOptions& options = ViewportPoolOptions(),
                          std::shared_ptr<SlotBackend> backend = nullptr,
                          std::shared_ptr<PressureSource> pressure = nullptr);
    ~ViewportPool();

    // Disable copy
    ViewportPool(const ViewportPool&) = delete;
    ViewportPool& operator=(const ViewportPool&) = delete;

    /// Acquire a slot for contentId. An invalid handle is backpressure
    /// (PoolExhausted) or a rejected request (InvalidParameter, DuplicateContent, Disposed).
    ViewportHandle acquire(ContentType type, const std::string& contentId);

    /// Release an in-use slot. Returns false if the slot is unknown or not in use.
    bool release(uint32_t poolId);

    /// Remove idle slots and shrink an underused pool, never below minPoolSize.
    GarbageCollectionResult runGarbageCollection();

    /// Burst mode check: when the memory estimate or the pressure reading is over
    /// its limit, remove available slots down to minPoolSize and run GC.
    /// Returns true when cleanup ran.
    bool checkMemoryPressure();

    // Introspection
    PooledViewport getSlot(uint32_t poolId) const;
    std::vector<PooledViewport> getSlots() const;
    size_t size() const;
    size_t estimateMemoryUsage() const;
    PoolStatistics getStatistics() const;
    PoolHealth getHealthStatus() const;
    const ViewportPoolOptions& getOptions() const;
    LoadingError getLastError() const;

    // Events
    SubscriptionId subscribe(std::function<void(const PoolEvent&)> listener);
    bool unsubscribe(SubscriptionId id);

    /// Cancel timers and destroy every slot. Later calls fail with Disposed.
    void dispose();
    bool isDisposed() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vp_stream
