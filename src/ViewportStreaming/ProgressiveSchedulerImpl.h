// SPDX-License-Identifier: MIT
// Internal implementation header for ProgressiveScheduler

#pragma once

#include <ViewportStreaming/ProgressiveScheduler.h>
#include <ViewportStreaming/CancellationToken.h>
#include "Internal/EventHub.h"
#include "Internal/ThreadPool.h"
#include "Internal/TicketImpl.h"
#include "Internal/TimerQueue.h"

#include <array>
#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace vp_stream {

/// Implementation class for ProgressiveScheduler (PIMPL pattern)
class ProgressiveScheduler::Impl {
public:
    Impl(const SchedulerOptions& options, std::shared_ptr<ItemSource> source, std::shared_ptr<PressureSource> pressure,
         std::shared_ptr<LazyActivationLayer> activation);
    ~Impl();

    // Non-copyable
    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    std::string createLoadingSession(const std::string& sessionId, const std::vector<std::string>& itemIds,
                                     const SessionMetadata& metadata, LoadingStrategy strategy,
                                     const ChunkCallbacks& callbacks);
    Ticket queueSession(const std::string& sessionId, LoadPriority priority);
    std::string loadDataset(const std::vector<std::string>& itemIds, const LoadDatasetOptions& options);
    Ticket getSessionTicket(const std::string& sessionId) const;
    bool cancelSession(const std::string& sessionId);
    bool cancelChunk(const std::string& chunkId);
    bool releaseSession(const std::string& sessionId);
    size_t processQueue();
    void start();
    void stop();
    bool isRunning() const;
    SessionProgress getSessionProgress(const std::string& sessionId) const;
    std::vector<ChunkProgress> getSessionChunks(const std::string& sessionId) const;
    ChunkProgress getChunkProgress(const std::string& chunkId) const;
    std::vector<ItemResult> getChunkResults(const std::string& chunkId) const;
    SchedulerStatistics getStatistics() const;
    size_t getActiveChunkCount() const;
    LoadingError getLastError() const;
    void setMaxConcurrentChunks(size_t count);
    size_t getMaxConcurrentChunks() const;
    SubscriptionId subscribe(std::function<void(const SchedulerEvent&)> listener);
    bool unsubscribe(SubscriptionId id);
    void dispose();
    bool isDisposed() const;

private:
    struct Chunk {
        std::string id;
        std::string sessionId;
        std::vector<std::string> itemIds;
        uint64_t sequence = 0;               // creation order, FIFO tie-break within a bucket
        uint64_t dispatch = 0;               // stamp of the current Loading run, 0 when not running
        TimePoint createdAt{};
        bool inBucket = false;
        bool ticketCounted = false;
        CancellationToken token;
        ChunkProgress progress;
    };

    struct Session {
        std::string id;
        SessionMetadata metadata;
        LoadingStrategy strategy = LoadingStrategy::Adaptive;
        size_t totalItems = 0;
        std::vector<std::string> chunkIds;
        TimePoint createdAt{};
        TimePoint lastAccessed{};
        bool queued = false;
        bool cancelled = false;
        bool completionNotified = false;
        std::string targetViewportId;
        ChunkCallbacks chunkCallbacks;
        std::function<void(const SessionProgress&)> onProgress;
        std::function<void(const std::string&, const SessionResults&)> onComplete;
        std::shared_ptr<TicketImpl> ticket;
    };

    struct RetainedResult {
        uint64_t sequence = 0;               // retention order, oldest evicted first
        std::vector<ItemResult> items;
    };

    // Deferred user notifications, delivered after mutex_ is released
    struct Notifications {
        std::vector<SchedulerEvent> events;
        std::vector<std::function<void()>> callbacks;
    };

    // Chunk execution on a worker thread
    void runChunk(const std::string& chunkId, uint64_t dispatch);

    // Helpers (require mutex_ held)
    void insertIntoBucketLocked(Chunk& chunk);
    void removeFromBucketLocked(Chunk& chunk);
    Chunk* popNextLocked();
    Chunk* findDispatchedLocked(const std::string& chunkId, uint64_t dispatch);
    void cancelChunkLocked(Chunk& chunk);
    void finishChunkTicketLocked(Chunk& chunk);
    void cancelSessionLocked(Session& session, Notifications& out);
    SessionProgress sessionProgressLocked(const Session& session) const;
    void notifySessionLocked(Session& session, Notifications& out);
    size_t evictRetainedLocked(Notifications& out);
    size_t queuedCountLocked() const;

    void deliver(Notifications& notifications);
    static SchedulerEvent makeEvent(SchedulerEventType type, const Chunk& chunk);

    SchedulerOptions options_;
    std::shared_ptr<ItemSource> source_;
    std::shared_ptr<LazyActivationLayer> activation_;
    MemoryMonitor memory_;
    NetworkMonitor network_;

    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
    std::unordered_map<std::string, Chunk> chunks_;
    std::array<std::deque<std::string>, kPriorityLevels> buckets_;
    std::unordered_map<std::string, RetainedResult> results_;
    size_t maxConcurrent_ = 1;
    size_t activeChunks_ = 0;
    uint64_t nextChunkSequence_ = 1;
    uint64_t nextResultSequence_ = 1;
    uint64_t nextDispatch_ = 1;
    uint64_t nextGeneratedId_ = 1;
    bool disposed_ = false;
    LoadingError lastError_ = LoadingError::Success;
    internal::TimerQueue::TimerId tickTimer_ = internal::TimerQueue::kInvalidTimer;

    uint64_t completedChunks_ = 0;
    uint64_t failedChunks_ = 0;
    uint64_t cancelledChunks_ = 0;
    uint64_t evictedChunks_ = 0;
    uint64_t loadedItems_ = 0;
    uint64_t failedItems_ = 0;

    std::atomic<bool> processing_{false};

    internal::EventHub<SchedulerEvent> events_;
    internal::ThreadPool workers_;
    internal::TimerQueue timers_;
};

} // namespace vp_stream
