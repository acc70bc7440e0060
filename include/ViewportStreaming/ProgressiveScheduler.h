#pragma once

#include "ItemSource/ItemSource.h"
#include "ItemSource/SessionInfo.h"
#include "ViewportStreaming/LazyActivationLayer.h"
#include "ViewportStreaming/Monitors.h"
#include "ViewportStreaming/Ticket.h"
#include "ViewportStreaming/Types.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vp_stream {

// Chunk priority, 1 = most urgent
enum class LoadPriority : int {
    Critical = 1,
    High = 2,
    Normal = 3,
    Low = 4,
    Idle = 5
};

constexpr int kPriorityLevels = 5;

const char* loadPriorityName(LoadPriority priority);

// How a session's chunks are sized and prioritized
enum class LoadingStrategy {
    Sequential = 0,
    Adaptive,
    PriorityBased,
    Predictive
};

const char* loadingStrategyName(LoadingStrategy strategy);

enum class ChunkStatus {
    Pending = 0,
    Loading,
    Completed,
    Error,
    Cancelled
};

const char* chunkStatusName(ChunkStatus status);

enum class SessionStatus {
    Pending = 0,    // created, never queued
    Loading,
    Completed,
    Error,
    Cancelled
};

const char* sessionStatusName(SessionStatus status);

struct ChunkProgress {
    std::string chunkId;
    std::string sessionId;
    bool valid = false;
    size_t chunkIndex = 0;
    size_t totalChunks = 0;
    LoadPriority priority = LoadPriority::Normal;
    size_t loadedImages = 0;
    size_t failedImages = 0;
    size_t totalImages = 0;
    size_t bytesLoaded = 0;
    size_t totalBytes = 0;               // estimate until the chunk completes
    double estimatedTimeRemaining = 0.0; // seconds
    double networkSpeed = 0.0;           // bytes/second
    ChunkStatus status = ChunkStatus::Pending;
    std::string error;
};

struct ItemResult {
    std::string itemId;
    bool loaded = false;
    size_t sizeBytes = 0;
    std::string error;
};

struct SessionProgress {
    std::string sessionId;
    bool valid = false;
    size_t totalChunks = 0;
    size_t pendingChunks = 0;
    size_t completedChunks = 0;
    size_t loadingChunks = 0;
    size_t errorChunks = 0;
    size_t cancelledChunks = 0;
    size_t totalImages = 0;
    size_t loadedImages = 0;
    size_t failedImages = 0;
    size_t totalBytes = 0;
    size_t loadedBytes = 0;
    int percentage = 0;
    SessionStatus status = SessionStatus::Pending;
};

using SessionResults = std::map<std::string, std::vector<ItemResult>>;

/// Per-chunk hooks, applied to every chunk of a session.
struct ChunkCallbacks {
    std::function<void(const ChunkProgress&)> onProgress;
    std::function<void(const ChunkProgress&, const std::vector<ItemResult>&)> onComplete;
    std::function<void(const ChunkProgress&)> onError;
};

// Configuration options
struct SchedulerOptions {
    size_t chunkSize = 10;
    size_t maxConcurrentChunks = 3;
    unsigned int workerThreads = 0;          // 0 = max(maxConcurrentChunks, 4)
    bool adaptiveChunkSize = true;
    bool networkAdaptation = true;
    std::chrono::milliseconds tickInterval{100};
    std::chrono::milliseconds chunkTimeout{30000};
    double memoryThreshold = 0.8;            // pressure reading that evicts retained results
    double deferDispatchPressure = 0.95;     // pressure reading at which dispatch pauses
    size_t estimatedItemBytes = 512 * 1024;
    bool autoStart = true;                   // start the tick loop on construction
};

struct LoadDatasetOptions {
    std::string sessionId;                   // generated when empty
    LoadingStrategy strategy = LoadingStrategy::Adaptive;
    LoadPriority priority = LoadPriority::Normal;
    SessionMetadata metadata;
    std::string targetViewportId;            // activated before each chunk when set
    ChunkCallbacks chunkCallbacks;
    std::function<void(const SessionProgress&)> onProgress;
    std::function<void(const std::string&, const SessionResults&)> onComplete;
};

enum class SchedulerEventType {
    ChunkQueued = 0,
    ChunkStarted,
    ChunkProgress,
    ChunkCompleted,
    ChunkError,
    ChunkEvicted,
    SessionCancelled,
    SessionCompleted
};

struct SchedulerEvent {
    SchedulerEventType type = SchedulerEventType::ChunkQueued;
    std::string sessionId;
    std::string chunkId;                     // empty for session events
    ChunkProgress progress;                  // chunk events only
};

struct SchedulerStatistics {
    std::array<size_t, kPriorityLevels> queuedByPriority{};
    size_t queuedChunks = 0;
    size_t activeChunks = 0;
    size_t retainedResults = 0;
    size_t sessions = 0;
    uint64_t completedChunks = 0;
    uint64_t failedChunks = 0;
    uint64_t cancelledChunks = 0;
    uint64_t evictedChunks = 0;
    uint64_t loadedItems = 0;
    uint64_t failedItems = 0;
    double averageNetworkSpeed = 0.0;
};

/// Splits item lists into prioritized chunks and loads them with bounded
/// concurrency from a periodic tick. All methods are thread-safe.
class ProgressiveScheduler {
public:
    using SubscriptionId = uint64_t;

    /// source defaults to an EstimatingItemSource; pressure feeds memory-pressure
    /// decisions; activation is used for sessions that name a target viewport.
    explicit ProgressiveScheduler(const SchedulerOptions& options = SchedulerOptions(),
                                  std::shared_ptr<ItemSource> source = nullptr,
                                  std::shared_ptr<PressureSource> pressure = nullptr,
                                  std::shared_ptr<LazyActivationLayer> activation = nullptr);
    ~ProgressiveScheduler();

    // Disable copy
    ProgressiveScheduler(const ProgressiveScheduler&) = delete;
    ProgressiveScheduler& operator=(const ProgressiveScheduler&) = delete;

    /// Partition itemIds into chunks. Returns the session id, or an empty
    /// string for an empty or duplicate id (see getLastError()).
    std::string createLoadingSession(const std::string& sessionId,
                                     const std::vector<std::string>& itemIds,
                                     const SessionMetadata& metadata = SessionMetadata(),
                                     LoadingStrategy strategy = LoadingStrategy::Adaptive,
                                     const ChunkCallbacks& callbacks = ChunkCallbacks());

    /// Put every pending chunk of the session into the bucket for priority.
    /// Queueing again moves pending chunks to the new priority. Returns an
    /// invalid Ticket for unknown or cancelled sessions.
    Ticket queueSession(const std::string& sessionId, LoadPriority priority = LoadPriority::Normal);

    /// createLoadingSession + queueSession in one call. Returns the session id
    /// or an empty string.
    std::string loadDataset(const std::vector<std::string>& itemIds,
                            const LoadDatasetOptions& options = LoadDatasetOptions());

    /// Ticket of a queued session; invalid if the session was never queued.
    Ticket getSessionTicket(const std::string& sessionId) const;

    /// Abort loading chunks and drop pending ones. Idempotent.
    bool cancelSession(const std::string& sessionId);

    /// Cancel one pending or loading chunk; the rest of its session keeps
    /// going. Returns false for unknown or already settled chunks.
    bool cancelChunk(const std::string& chunkId);

    /// Forget a session, its progress and retained results. Unfinished chunks are cancelled.
    bool releaseSession(const std::string& sessionId);

    /// Run one scheduling pass now. Returns the number of chunks dispatched;
    /// 0 if another pass is already running.
    size_t processQueue();

    /// Start or stop the periodic tick.
    void start();
    void stop();
    bool isRunning() const;

    // Introspection
    SessionProgress getSessionProgress(const std::string& sessionId) const;
    std::vector<ChunkProgress> getSessionChunks(const std::string& sessionId) const;
    ChunkProgress getChunkProgress(const std::string& chunkId) const;
    std::vector<ItemResult> getChunkResults(const std::string& chunkId) const;
    SchedulerStatistics getStatistics() const;
    size_t getActiveChunkCount() const;
    LoadingError getLastError() const;

    /// Clamped to [1, worker threads].
    void setMaxConcurrentChunks(size_t count);
    size_t getMaxConcurrentChunks() const;

    // Events
    SubscriptionId subscribe(std::function<void(const SchedulerEvent&)> listener);
    bool unsubscribe(SubscriptionId id);

    /// Stop the tick, cancel all work and wait for running chunks to return.
    void dispose();
    bool isDisposed() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vp_stream
