#pragma once

#include "ViewportStreaming/Types.h"
#include "ViewportStreaming/ViewportPool.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vp_stream {

/// Rendering-engine hook that binds a logical viewport to real resources.
/// materialize() runs without any layer lock held and may block; dematerialize()
/// is called with the layer lock held and must not call back into the layer.
/// Exceptions are caught: a throwing materialize() counts as a failed activation.
class ViewportMaterializer {
public:
    virtual ~ViewportMaterializer() = default;

    /// slot is the pool slot acquired for this viewport, or an invalid handle
    /// when the layer runs without a pool. Return false on failure.
    virtual bool materialize(const std::string& viewportId, SurfaceHandle surface, const ViewportHandle& slot) = 0;

    virtual void dematerialize(const std::string& viewportId) = 0;
};

enum class ViewportState {
    Uninitialized = 0,
    Initializing,
    Ready,
    Error,
    Disposed
};

const char* viewportStateName(ViewportState state);

using ViewportMetadata = std::map<std::string, std::string>;

// Configuration options
struct ActivationOptions {
    size_t maxActiveViewports = 4;
    bool preloadAdjacent = true;
    std::chrono::milliseconds preloadDelay{500};
    std::chrono::milliseconds inactivityTimeout{30000};
    size_t memoryThreshold = 500ULL * 1024 * 1024;   // 500 MB
    size_t bytesPerViewport = 50ULL * 1024 * 1024;   // 50 MB estimate
    bool enablePredictiveLoading = true;
    std::chrono::milliseconds predictionInterval{5000};
    size_t predictionWindow = 10;                    // most recent accesses considered
    double predictionThreshold = 0.7;
    std::chrono::milliseconds predictivePreloadDelay{1000};
    std::chrono::milliseconds activationWaitTimeout{5000};
    std::chrono::milliseconds memoryCheckInterval{10000};
    size_t maxDeactivationsPerAttempt = 2;
    ContentType slotType = ContentType::Stack;       // pool slot type acquired on activation
};

/// Snapshot of one registered viewport
struct ViewportInfo {
    std::string id;
    bool valid = false;
    ViewportState state = ViewportState::Disposed;
    TimePoint lastAccessTime{};
    uint64_t accessCount = 0;
    int priority = 0;
    bool preloaded = false;          // activated by a preload and not accessed since
    SurfaceHandle surface = nullptr;
    uint32_t poolId = 0;             // 0 when no pool slot is held
    ViewportMetadata metadata;
};

struct ViewportPrediction {
    std::string viewportId;
    double probability = 0.0;
    std::string reason;
    std::chrono::milliseconds suggestedPreloadDelay{0};
};

struct MemoryUsage {
    size_t used = 0;
    size_t threshold = 0;
    std::map<std::string, size_t> viewports;
};

enum class ActivationEventType {
    Ready = 0,
    Deactivated,
    Error,
    Preloaded
};

struct ActivationEvent {
    ActivationEventType type = ActivationEventType::Ready;
    std::string viewportId;
};

/// Lazily materializes registered viewports on first use, deactivates them
/// after inactivity, and preloads likely-next viewports in the background.
/// All methods are thread-safe.
class LazyActivationLayer {
public:
    using SubscriptionId = uint64_t;

    explicit LazyActivationLayer(const ActivationOptions& options = ActivationOptions(),
                                 std::shared_ptr<ViewportMaterializer> materializer = nullptr,
                                 std::shared_ptr<ViewportPool> pool = nullptr);
    ~LazyActivationLayer();

    // Disable copy
    LazyActivationLayer(const LazyActivationLayer&) = delete;
    LazyActivationLayer& operator=(const LazyActivationLayer&) = delete;

    /// Register a viewport in the uninitialized state. Returns false for a duplicate id.
    bool registerViewport(const std::string& viewportId, const ViewportMetadata& metadata = ViewportMetadata());
    bool unregisterViewport(const std::string& viewportId);

    /// Make a viewport ready. Concurrent calls for one id share a single
    /// materialization. Returns false when not admitted or when activation failed.
    /// immediate skips the admission check.
    bool activateViewport(const std::string& viewportId, SurfaceHandle surface = nullptr, bool immediate = false);

    /// Release a ready viewport. Returns false if it is not ready.
    bool deactivateViewport(const std::string& viewportId);

    /// Best-effort background activation: only when admissible without
    /// deactivating anything. Does not count as an access.
    bool preloadViewport(const std::string& viewportId);

    // Introspection
    ViewportInfo getViewportState(const std::string& viewportId) const;
    std::vector<std::string> getActiveViewports() const;
    std::vector<std::string> getLoadingQueue() const;
    MemoryUsage getMemoryUsage() const;
    std::vector<ViewportPrediction> predictNextViewports() const;
    LoadingError getLastError() const;

    // Runtime settings
    void setViewportPriority(const std::string& viewportId, int priority);
    void setPredictiveLoading(bool enabled);
    bool isPredictiveLoadingEnabled() const;

    // Events
    SubscriptionId subscribe(std::function<void(const ActivationEvent&)> listener);
    bool unsubscribe(SubscriptionId id);

    /// Cancel timers, wait for background preloads and deactivate everything.
    void dispose();
    bool isDisposed() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vp_stream
