// SPDX-License-Identifier: MIT
// Internal implementation for ProgressiveScheduler

#include "ProgressiveSchedulerImpl.h"
#include "Internal/ChunkPlanner.h"
#include <ItemSource/EstimatingItemSource.h>
#include <ViewportStreaming/Logging.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace vp_stream {

namespace {

SchedulerOptions sanitizeOptions(SchedulerOptions options) {
    if (options.chunkSize == 0) {
        logMessage(LogLevel::Warn, "ProgressiveScheduler: chunkSize 0 raised to 1");
        options.chunkSize = 1;
    }
    if (options.maxConcurrentChunks == 0) {
        logMessage(LogLevel::Warn, "ProgressiveScheduler: maxConcurrentChunks 0 raised to 1");
        options.maxConcurrentChunks = 1;
    }
    if (options.estimatedItemBytes == 0) {
        options.estimatedItemBytes = ItemSource::kDefaultItemBytes;
    }
    return options;
}

unsigned int workerCountFor(const SchedulerOptions& options) {
    if (options.workerThreads > 0) {
        return options.workerThreads;
    }
    return static_cast<unsigned int>(std::max<size_t>(4, options.maxConcurrentChunks));
}

size_t bucketIndex(LoadPriority priority) {
    return static_cast<size_t>(static_cast<int>(priority) - 1);
}

bool validPriority(LoadPriority priority) {
    int level = static_cast<int>(priority);
    return level >= 1 && level <= kPriorityLevels;
}

} // namespace

const char* loadPriorityName(LoadPriority priority) {
    switch (priority) {
        case LoadPriority::Critical: return "critical";
        case LoadPriority::High: return "high";
        case LoadPriority::Normal: return "normal";
        case LoadPriority::Low: return "low";
        case LoadPriority::Idle: return "idle";
        default: return "unknown";
    }
}

const char* loadingStrategyName(LoadingStrategy strategy) {
    switch (strategy) {
        case LoadingStrategy::Sequential: return "sequential";
        case LoadingStrategy::Adaptive: return "adaptive";
        case LoadingStrategy::PriorityBased: return "priority-based";
        case LoadingStrategy::Predictive: return "predictive";
        default: return "unknown";
    }
}

const char* chunkStatusName(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Pending: return "pending";
        case ChunkStatus::Loading: return "loading";
        case ChunkStatus::Completed: return "completed";
        case ChunkStatus::Error: return "error";
        case ChunkStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

const char* sessionStatusName(SessionStatus status) {
    switch (status) {
        case SessionStatus::Pending: return "pending";
        case SessionStatus::Loading: return "loading";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Error: return "error";
        case SessionStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

ProgressiveScheduler::Impl::Impl(const SchedulerOptions& options, std::shared_ptr<ItemSource> source,
                                 std::shared_ptr<PressureSource> pressure,
                                 std::shared_ptr<LazyActivationLayer> activation)
    : options_(sanitizeOptions(options))
    , source_(std::move(source))
    , activation_(std::move(activation))
    , memory_(std::move(pressure), options_.memoryThreshold)
    , events_("ProgressiveScheduler")
    , workers_(workerCountFor(options_), "ProgressiveScheduler")
    , timers_("ProgressiveScheduler")
{
    if (!source_) {
        source_ = std::make_shared<EstimatingItemSource>(options_.estimatedItemBytes);
    }
    maxConcurrent_ = std::min<size_t>(options_.maxConcurrentChunks, workers_.size());

    logMessage(LogLevel::Info, "ProgressiveScheduler: initialized chunkSize=%zu maxConcurrent=%zu workers=%u",
               options_.chunkSize, maxConcurrent_, workers_.size());

    if (options_.autoStart) {
        start();
    }
}

ProgressiveScheduler::Impl::~Impl() {
    dispose();
}

// ---------------------------------------------------------------------------
// Sessions
// ---------------------------------------------------------------------------

std::string ProgressiveScheduler::Impl::createLoadingSession(const std::string& sessionId,
                                                             const std::vector<std::string>& itemIds,
                                                             const SessionMetadata& metadata,
                                                             LoadingStrategy strategy,
                                                             const ChunkCallbacks& callbacks) {
    if (sessionId.empty()) {
        logMessage(LogLevel::Error, "ProgressiveScheduler::createLoadingSession: empty session id");
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = LoadingError::InvalidParameter;
        return std::string();
    }

    // Collaborator calls stay outside the lock
    std::vector<size_t> estimates(itemIds.size(), options_.estimatedItemBytes);
    for (size_t i = 0; i < itemIds.size(); ++i) {
        try {
            estimates[i] = source_->estimateSize(itemIds[i]);
        } catch (const std::exception& e) {
            logMessage(LogLevel::Warn, "ProgressiveScheduler: estimateSize('%s') threw: %s", itemIds[i].c_str(), e.what());
        }
    }

    internal::ChunkSizingInputs sizing;
    sizing.baseChunkSize = options_.chunkSize;
    sizing.totalItems = itemIds.size();
    sizing.strategy = strategy;
    sizing.networkBytesPerSecond = network_.getAverageSpeed();
    sizing.memoryUsage = memory_.getCurrentUsage();
    sizing.adaptive = options_.adaptiveChunkSize;
    sizing.networkAdaptation = options_.networkAdaptation;
    const size_t chunkSize = internal::computeChunkSize(sizing);
    const auto ranges = internal::partitionItems(itemIds.size(), chunkSize);

    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        lastError_ = LoadingError::Disposed;
        return std::string();
    }
    if (sessions_.count(sessionId)) {
        logMessage(LogLevel::Warn, "ProgressiveScheduler::createLoadingSession: '%s' already exists", sessionId.c_str());
        lastError_ = LoadingError::AlreadyExists;
        return std::string();
    }
    for (size_t i = 0; i < ranges.size(); ++i) {
        if (chunks_.count(sessionId + "-chunk-" + std::to_string(i))) {
            logMessage(LogLevel::Warn, "ProgressiveScheduler::createLoadingSession: chunk ids of '%s' collide",
                       sessionId.c_str());
            lastError_ = LoadingError::AlreadyExists;
            return std::string();
        }
    }

    const TimePoint now = Clock::now();
    Session session;
    session.id = sessionId;
    session.metadata = metadata;
    session.strategy = strategy;
    session.totalItems = itemIds.size();
    session.createdAt = now;
    session.lastAccessed = now;
    session.chunkCallbacks = callbacks;

    for (size_t i = 0; i < ranges.size(); ++i) {
        Chunk chunk;
        chunk.id = sessionId + "-chunk-" + std::to_string(i);
        chunk.sessionId = sessionId;
        chunk.itemIds.assign(itemIds.begin() + static_cast<std::ptrdiff_t>(ranges[i].first),
                             itemIds.begin() + static_cast<std::ptrdiff_t>(ranges[i].second));
        chunk.sequence = nextChunkSequence_++;
        chunk.createdAt = now;

        ChunkProgress& progress = chunk.progress;
        progress.chunkId = chunk.id;
        progress.sessionId = sessionId;
        progress.valid = true;
        progress.chunkIndex = i;
        progress.totalChunks = ranges.size();
        progress.priority = internal::chunkPriority(i, ranges.size(), strategy);
        progress.totalImages = chunk.itemIds.size();
        for (size_t k = ranges[i].first; k < ranges[i].second; ++k) {
            progress.totalBytes += estimates[k];
        }
        progress.networkSpeed = sizing.networkBytesPerSecond;
        progress.status = ChunkStatus::Pending;

        session.chunkIds.push_back(chunk.id);
        chunks_.emplace(chunk.id, std::move(chunk));
    }

    sessions_.emplace(sessionId, std::move(session));
    lastError_ = LoadingError::Success;

    logMessage(LogLevel::Info, "ProgressiveScheduler: session '%s' (%s) items=%zu chunks=%zu chunkSize=%zu strategy=%s",
               sessionId.c_str(), describeSession(metadata).c_str(), itemIds.size(), ranges.size(), chunkSize,
               loadingStrategyName(strategy));
    return sessionId;
}

Ticket ProgressiveScheduler::Impl::queueSession(const std::string& sessionId, LoadPriority priority) {
    Notifications out;
    Ticket ticket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            lastError_ = LoadingError::Disposed;
            return Ticket();
        }
        if (!validPriority(priority)) {
            logMessage(LogLevel::Error, "ProgressiveScheduler::queueSession: invalid priority %d",
                       static_cast<int>(priority));
            lastError_ = LoadingError::InvalidParameter;
            return Ticket();
        }
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            logMessage(LogLevel::Warn, "ProgressiveScheduler::queueSession: unknown session '%s'", sessionId.c_str());
            lastError_ = LoadingError::NotFound;
            return Ticket();
        }
        Session& session = it->second;
        if (session.cancelled) {
            logMessage(LogLevel::Warn, "ProgressiveScheduler::queueSession: session '%s' was cancelled",
                       sessionId.c_str());
            lastError_ = LoadingError::InvalidState;
            return Ticket();
        }

        if (!session.ticket) {
            session.ticket = std::make_shared<TicketImpl>(static_cast<int>(session.chunkIds.size()));
            for (const std::string& chunkId : session.chunkIds) {
                if (chunks_.at(chunkId).ticketCounted) {
                    session.ticket->markTaskDone();
                }
            }
        }
        session.queued = true;
        session.lastAccessed = Clock::now();

        size_t queued = 0;
        for (const std::string& chunkId : session.chunkIds) {
            Chunk& chunk = chunks_.at(chunkId);
            if (chunk.progress.status != ChunkStatus::Pending) {
                continue;
            }
            removeFromBucketLocked(chunk);
            chunk.progress.priority = priority;
            insertIntoBucketLocked(chunk);
            out.events.push_back(makeEvent(SchedulerEventType::ChunkQueued, chunk));
            ++queued;
        }
        notifySessionLocked(session, out);
        ticket = Ticket(session.ticket);
        lastError_ = LoadingError::Success;

        logMessage(LogLevel::Info, "ProgressiveScheduler: queued session '%s' chunks=%zu priority=%s", sessionId.c_str(),
                   queued, loadPriorityName(priority));
    }
    deliver(out);
    return ticket;
}

std::string ProgressiveScheduler::Impl::loadDataset(const std::vector<std::string>& itemIds,
                                                    const LoadDatasetOptions& options) {
    std::string sessionId = options.sessionId;
    if (sessionId.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        do {
            sessionId = "session-" + std::to_string(nextGeneratedId_++);
        } while (sessions_.count(sessionId));
    }

    SessionMetadata metadata = options.metadata;
    if (metadata.studyUid.empty()) metadata.studyUid = "unknown";
    if (metadata.seriesUid.empty()) metadata.seriesUid = "unknown";
    if (metadata.modality.empty()) metadata.modality = "unknown";

    if (createLoadingSession(sessionId, itemIds, metadata, options.strategy, options.chunkCallbacks).empty()) {
        return std::string();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            lastError_ = LoadingError::NotFound;
            return std::string();
        }
        it->second.targetViewportId = options.targetViewportId;
        it->second.onProgress = options.onProgress;
        it->second.onComplete = options.onComplete;
    }
    if (!queueSession(sessionId, options.priority).valid()) {
        return std::string();
    }
    return sessionId;
}

Ticket ProgressiveScheduler::Impl::getSessionTicket(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end() || !it->second.ticket) {
        return Ticket();
    }
    return Ticket(it->second.ticket);
}

bool ProgressiveScheduler::Impl::cancelSession(const std::string& sessionId) {
    Notifications out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            lastError_ = LoadingError::NotFound;
            return false;
        }
        cancelSessionLocked(it->second, out);
        lastError_ = LoadingError::Success;
    }
    deliver(out);
    return true;
}

bool ProgressiveScheduler::Impl::cancelChunk(const std::string& chunkId) {
    Notifications out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = chunks_.find(chunkId);
        if (it == chunks_.end()) {
            lastError_ = LoadingError::NotFound;
            return false;
        }
        Chunk& chunk = it->second;
        if (chunk.progress.status != ChunkStatus::Pending && chunk.progress.status != ChunkStatus::Loading) {
            lastError_ = LoadingError::InvalidState;
            return false;
        }
        const bool wasLoading = chunk.progress.status == ChunkStatus::Loading;
        cancelChunkLocked(chunk);
        auto sessionIt = sessions_.find(chunk.sessionId);
        if (sessionIt != sessions_.end()) {
            notifySessionLocked(sessionIt->second, out);
        }
        lastError_ = LoadingError::Success;
        logMessage(LogLevel::Info, "ProgressiveScheduler: cancelled %s chunk '%s'", wasLoading ? "loading" : "pending",
                   chunkId.c_str());
    }
    deliver(out);
    return true;
}

bool ProgressiveScheduler::Impl::releaseSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        lastError_ = LoadingError::NotFound;
        return false;
    }
    Session& session = it->second;
    for (const std::string& chunkId : session.chunkIds) {
        auto chunkIt = chunks_.find(chunkId);
        if (chunkIt == chunks_.end()) {
            continue;
        }
        Chunk& chunk = chunkIt->second;
        if (chunk.progress.status == ChunkStatus::Pending || chunk.progress.status == ChunkStatus::Loading) {
            removeFromBucketLocked(chunk);
            chunk.token.cancel();
            chunk.progress.status = ChunkStatus::Cancelled;
            ++cancelledChunks_;
        }
        results_.erase(chunkId);
        chunks_.erase(chunkIt);
    }
    // Running chunks notice the missing entry and only give back their slot
    if (session.ticket) {
        session.ticket->markAllDone();
    }
    sessions_.erase(it);
    lastError_ = LoadingError::Success;
    logMessage(LogLevel::Debug, "ProgressiveScheduler: released session '%s'", sessionId.c_str());
    return true;
}

// ---------------------------------------------------------------------------
// Scheduling
// ---------------------------------------------------------------------------

size_t ProgressiveScheduler::Impl::processQueue() {
    bool expected = false;
    if (!processing_.compare_exchange_strong(expected, true)) {
        return 0;
    }
    struct ProcessingGuard {
        std::atomic<bool>& flag;
        ~ProcessingGuard() { flag.store(false); }
    } guard{processing_};

    Notifications out;
    std::vector<std::pair<std::string, uint64_t>> toRun;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return 0;
        }

        double usage = memory_.getCurrentUsage();
        bool deferred = false;
        if (usage > memory_.getThreshold()) {
            size_t evicted = evictRetainedLocked(out);
            logMessage(LogLevel::Warn, "ProgressiveScheduler: memory pressure %.2f, evicted %zu retained chunk results",
                       usage, evicted);
            deferred = usage >= options_.deferDispatchPressure;
        }

        while (!deferred && activeChunks_ < maxConcurrent_) {
            Chunk* chunk = popNextLocked();
            if (!chunk) {
                break;
            }
            chunk->progress.status = ChunkStatus::Loading;
            chunk->progress.error.clear();
            chunk->token = CancellationToken();
            if (options_.chunkTimeout.count() > 0) {
                chunk->token.setDeadline(Clock::now() + options_.chunkTimeout);
            }
            chunk->dispatch = nextDispatch_++;
            ++activeChunks_;
            toRun.emplace_back(chunk->id, chunk->dispatch);
            out.events.push_back(makeEvent(SchedulerEventType::ChunkStarted, *chunk));
        }
    }
    deliver(out);

    size_t dispatched = 0;
    for (const auto& run : toRun) {
        const std::string& chunkId = run.first;
        const uint64_t dispatch = run.second;
        if (workers_.submit([this, chunkId, dispatch] { runChunk(chunkId, dispatch); })) {
            ++dispatched;
            logMessage(LogLevel::Debug, "ProgressiveScheduler: dispatched '%s'", chunkId.c_str());
            continue;
        }
        // Worker pool already shutting down
        std::lock_guard<std::mutex> lock(mutex_);
        --activeChunks_;
        Chunk* chunk = findDispatchedLocked(chunkId, dispatch);
        if (chunk && chunk->progress.status == ChunkStatus::Loading) {
            chunk->progress.status = ChunkStatus::Cancelled;
            chunk->dispatch = 0;
            ++cancelledChunks_;
            finishChunkTicketLocked(*chunk);
        }
    }
    return dispatched;
}

void ProgressiveScheduler::Impl::runChunk(const std::string& chunkId, uint64_t dispatch) {
    std::vector<std::string> items;
    CancellationToken token;
    std::string target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Chunk* chunk = findDispatchedLocked(chunkId, dispatch);
        if (!chunk || chunk->progress.status != ChunkStatus::Loading) {
            --activeChunks_;
            return;
        }
        items = chunk->itemIds;
        token = chunk->token;
        auto sessionIt = sessions_.find(chunk->sessionId);
        if (sessionIt != sessions_.end()) {
            target = sessionIt->second.targetViewportId;
        }
    }

    if (!target.empty() && activation_ && !activation_->activateViewport(target)) {
        // Viewport backpressure: give the slot back and retry on a later tick
        std::lock_guard<std::mutex> lock(mutex_);
        --activeChunks_;
        Chunk* chunk = findDispatchedLocked(chunkId, dispatch);
        if (chunk && chunk->progress.status == ChunkStatus::Loading) {
            chunk->progress.status = ChunkStatus::Pending;
            chunk->dispatch = 0;
            insertIntoBucketLocked(*chunk);
        }
        logMessage(LogLevel::Info, "ProgressiveScheduler: viewport '%s' not available, requeued '%s'", target.c_str(),
                   chunkId.c_str());
        return;
    }

    const TimePoint start = Clock::now();
    std::vector<ItemResult> results;
    results.reserve(items.size());
    bool aborted = false;

    for (const std::string& itemId : items) {
        if (token.isCancelled()) {
            aborted = true;
            break;
        }

        ItemFetchResult fetched;
        try {
            fetched = source_->fetch(itemId, token);
        } catch (const std::exception& e) {
            fetched.ok = false;
            fetched.error = e.what();
        }
        if (!fetched.ok && token.isCancelled()) {
            aborted = true;
            break;
        }

        ItemResult result;
        result.itemId = itemId;
        result.loaded = fetched.ok;
        if (fetched.ok) {
            result.sizeBytes = fetched.sizeBytes;
        } else {
            result.error = fetched.error.empty() ? std::string("fetch failed") : fetched.error;
            logMessage(LogLevel::Warn, "ProgressiveScheduler: item '%s' in '%s' failed: %s", itemId.c_str(),
                       chunkId.c_str(), result.error.c_str());
        }
        results.push_back(result);

        Notifications out;
        bool stillLoading = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Chunk* current = findDispatchedLocked(chunkId, dispatch);
            if (current && current->progress.status == ChunkStatus::Loading) {
                stillLoading = true;
                Chunk& chunk = *current;
                ChunkProgress& progress = chunk.progress;
                if (result.loaded) {
                    ++progress.loadedImages;
                    progress.bytesLoaded += result.sizeBytes;
                    ++loadedItems_;
                } else {
                    ++progress.failedImages;
                    ++failedItems_;
                }

                double seconds = std::max<int64_t>(1, elapsedMs(start, Clock::now())) / 1000.0;
                progress.networkSpeed = static_cast<double>(progress.bytesLoaded) / seconds;
                size_t remaining = progress.totalBytes > progress.bytesLoaded ? progress.totalBytes - progress.bytesLoaded : 0;
                progress.estimatedTimeRemaining =
                    progress.networkSpeed > 0.0 ? static_cast<double>(remaining) / progress.networkSpeed : 0.0;

                out.events.push_back(makeEvent(SchedulerEventType::ChunkProgress, chunk));
                auto sessionIt = sessions_.find(chunk.sessionId);
                if (sessionIt != sessions_.end()) {
                    Session& session = sessionIt->second;
                    if (session.chunkCallbacks.onProgress) {
                        auto callback = session.chunkCallbacks.onProgress;
                        ChunkProgress snapshot = progress;
                        out.callbacks.push_back([callback, snapshot] { callback(snapshot); });
                    }
                    notifySessionLocked(session, out);
                }
            }
        }
        deliver(out);
        if (!stillLoading) {
            aborted = true;
            break;
        }
    }

    Notifications out;
    size_t bytesLoaded = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --activeChunks_;
        Chunk* current = findDispatchedLocked(chunkId, dispatch);
        if (!current) {
            // Released, or the id now belongs to a recreated session
            return;
        }
        Chunk& chunk = *current;
        chunk.dispatch = 0;
        ChunkProgress& progress = chunk.progress;
        bytesLoaded = progress.bytesLoaded;
        auto sessionIt = sessions_.find(chunk.sessionId);
        Session* session = sessionIt != sessions_.end() ? &sessionIt->second : nullptr;

        if (progress.status != ChunkStatus::Loading) {
            // Cancelled while running; the canceller already settled the ticket
        } else if (aborted && token.cancellationRequested()) {
            progress.status = ChunkStatus::Cancelled;
            ++cancelledChunks_;
            finishChunkTicketLocked(chunk);
        } else if (aborted) {
            progress.status = ChunkStatus::Error;
            progress.error = "timed out after " + std::to_string(options_.chunkTimeout.count()) + " ms";
            ++failedChunks_;
            finishChunkTicketLocked(chunk);
            out.events.push_back(makeEvent(SchedulerEventType::ChunkError, chunk));
            if (session && session->chunkCallbacks.onError) {
                auto callback = session->chunkCallbacks.onError;
                ChunkProgress snapshot = progress;
                out.callbacks.push_back([callback, snapshot] { callback(snapshot); });
            }
            logMessage(LogLevel::Warn, "ProgressiveScheduler: chunk '%s' %s (%zu/%zu items)", chunkId.c_str(),
                       progress.error.c_str(), progress.loadedImages, progress.totalImages);
        } else {
            progress.status = ChunkStatus::Completed;
            progress.estimatedTimeRemaining = 0.0;
            RetainedResult retained;
            retained.sequence = nextResultSequence_++;
            retained.items = results;
            results_[chunkId] = std::move(retained);
            ++completedChunks_;
            finishChunkTicketLocked(chunk);
            out.events.push_back(makeEvent(SchedulerEventType::ChunkCompleted, chunk));
            if (session && session->chunkCallbacks.onComplete) {
                auto callback = session->chunkCallbacks.onComplete;
                ChunkProgress snapshot = progress;
                out.callbacks.push_back([callback, snapshot, results] { callback(snapshot, results); });
            }
            logMessage(LogLevel::Info, "ProgressiveScheduler: chunk '%s' completed loaded=%zu failed=%zu in %lld ms",
                       chunkId.c_str(), progress.loadedImages, progress.failedImages,
                       static_cast<long long>(elapsedMs(start, Clock::now())));
        }

        if (session) {
            notifySessionLocked(*session, out);
        }
    }

    if (bytesLoaded > 0) {
        network_.recordTransfer(bytesLoaded,
                                std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start));
    }
    deliver(out);
}

void ProgressiveScheduler::Impl::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || tickTimer_ != internal::TimerQueue::kInvalidTimer) {
        return;
    }
    tickTimer_ = timers_.scheduleRepeating(options_.tickInterval, [this] { processQueue(); });
}

void ProgressiveScheduler::Impl::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.cancel(tickTimer_);
    tickTimer_ = internal::TimerQueue::kInvalidTimer;
}

bool ProgressiveScheduler::Impl::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tickTimer_ != internal::TimerQueue::kInvalidTimer;
}

// ---------------------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------------------

SessionProgress ProgressiveScheduler::Impl::getSessionProgress(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        SessionProgress missing;
        missing.sessionId = sessionId;
        return missing;
    }
    return sessionProgressLocked(it->second);
}

std::vector<ChunkProgress> ProgressiveScheduler::Impl::getSessionChunks(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkProgress> out;
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return out;
    }
    for (const std::string& chunkId : it->second.chunkIds) {
        out.push_back(chunks_.at(chunkId).progress);
    }
    return out;
}

ChunkProgress ProgressiveScheduler::Impl::getChunkProgress(const std::string& chunkId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunks_.find(chunkId);
    if (it == chunks_.end()) {
        ChunkProgress missing;
        missing.chunkId = chunkId;
        return missing;
    }
    return it->second.progress;
}

std::vector<ItemResult> ProgressiveScheduler::Impl::getChunkResults(const std::string& chunkId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = results_.find(chunkId);
    if (it == results_.end()) {
        return std::vector<ItemResult>();
    }
    return it->second.items;
}

SchedulerStatistics ProgressiveScheduler::Impl::getStatistics() const {
    SchedulerStatistics stats;
    stats.averageNetworkSpeed = network_.getAverageSpeed();

    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < buckets_.size(); ++i) {
        stats.queuedByPriority[i] = buckets_[i].size();
    }
    stats.queuedChunks = queuedCountLocked();
    stats.activeChunks = activeChunks_;
    stats.retainedResults = results_.size();
    stats.sessions = sessions_.size();
    stats.completedChunks = completedChunks_;
    stats.failedChunks = failedChunks_;
    stats.cancelledChunks = cancelledChunks_;
    stats.evictedChunks = evictedChunks_;
    stats.loadedItems = loadedItems_;
    stats.failedItems = failedItems_;
    return stats;
}

size_t ProgressiveScheduler::Impl::getActiveChunkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeChunks_;
}

LoadingError ProgressiveScheduler::Impl::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

void ProgressiveScheduler::Impl::setMaxConcurrentChunks(size_t count) {
    size_t workers = workers_.size();
    size_t clamped = std::min(std::max<size_t>(1, count), workers);
    if (clamped != count) {
        logMessage(LogLevel::Warn, "ProgressiveScheduler: maxConcurrentChunks %zu clamped to %zu (workers=%zu)", count,
                   clamped, workers);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    maxConcurrent_ = clamped;
}

size_t ProgressiveScheduler::Impl::getMaxConcurrentChunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxConcurrent_;
}

ProgressiveScheduler::SubscriptionId ProgressiveScheduler::Impl::subscribe(
    std::function<void(const SchedulerEvent&)> listener) {
    return events_.subscribe(std::move(listener));
}

bool ProgressiveScheduler::Impl::unsubscribe(SubscriptionId id) {
    return events_.unsubscribe(id);
}

void ProgressiveScheduler::Impl::dispose() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
        lastError_ = LoadingError::Disposed;
        for (auto& entry : chunks_) {
            Chunk& chunk = entry.second;
            if (chunk.progress.status == ChunkStatus::Pending || chunk.progress.status == ChunkStatus::Loading) {
                chunk.token.cancel();
                chunk.progress.status = ChunkStatus::Cancelled;
                chunk.inBucket = false;
            }
        }
        for (auto& entry : sessions_) {
            if (entry.second.ticket) {
                entry.second.ticket->markAllDone();
            }
        }
        for (auto& bucket : buckets_) {
            bucket.clear();
        }
        tickTimer_ = internal::TimerQueue::kInvalidTimer;
    }

    timers_.shutdown();
    // Running chunks see their cancelled tokens and return
    workers_.shutdown();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.clear();
        chunks_.clear();
        results_.clear();
    }
    events_.clear();
    logMessage(LogLevel::Info, "ProgressiveScheduler: disposed");
}

bool ProgressiveScheduler::Impl::isDisposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

void ProgressiveScheduler::Impl::insertIntoBucketLocked(Chunk& chunk) {
    auto& bucket = buckets_[bucketIndex(chunk.progress.priority)];
    auto pos = std::find_if(bucket.begin(), bucket.end(), [&](const std::string& id) {
        auto it = chunks_.find(id);
        return it != chunks_.end() && it->second.sequence > chunk.sequence;
    });
    bucket.insert(pos, chunk.id);
    chunk.inBucket = true;
}

void ProgressiveScheduler::Impl::removeFromBucketLocked(Chunk& chunk) {
    if (!chunk.inBucket) {
        return;
    }
    auto& bucket = buckets_[bucketIndex(chunk.progress.priority)];
    bucket.erase(std::remove(bucket.begin(), bucket.end(), chunk.id), bucket.end());
    chunk.inBucket = false;
}

ProgressiveScheduler::Impl::Chunk* ProgressiveScheduler::Impl::popNextLocked() {
    for (auto& bucket : buckets_) {
        while (!bucket.empty()) {
            std::string id = bucket.front();
            bucket.pop_front();
            auto it = chunks_.find(id);
            if (it != chunks_.end() && it->second.progress.status == ChunkStatus::Pending) {
                it->second.inBucket = false;
                return &it->second;
            }
        }
    }
    return nullptr;
}

ProgressiveScheduler::Impl::Chunk* ProgressiveScheduler::Impl::findDispatchedLocked(const std::string& chunkId,
                                                                                  uint64_t dispatch) {
    auto it = chunks_.find(chunkId);
    if (it == chunks_.end() || it->second.dispatch != dispatch) {
        return nullptr;
    }
    return &it->second;
}

void ProgressiveScheduler::Impl::finishChunkTicketLocked(Chunk& chunk) {
    if (chunk.ticketCounted) {
        return;
    }
    chunk.ticketCounted = true;
    auto it = sessions_.find(chunk.sessionId);
    if (it != sessions_.end() && it->second.ticket) {
        it->second.ticket->markTaskDone();
    }
}

void ProgressiveScheduler::Impl::cancelChunkLocked(Chunk& chunk) {
    removeFromBucketLocked(chunk);
    chunk.token.cancel();
    chunk.progress.status = ChunkStatus::Cancelled;
    chunk.progress.estimatedTimeRemaining = 0.0;
    ++cancelledChunks_;
    // Chunks of a never-queued session are counted when its Ticket is created
    finishChunkTicketLocked(chunk);
}

void ProgressiveScheduler::Impl::cancelSessionLocked(Session& session, Notifications& out) {
    if (session.cancelled) {
        return;
    }
    session.cancelled = true;

    size_t cancelled = 0;
    for (const std::string& chunkId : session.chunkIds) {
        Chunk& chunk = chunks_.at(chunkId);
        if (chunk.progress.status != ChunkStatus::Pending && chunk.progress.status != ChunkStatus::Loading) {
            continue;
        }
        cancelChunkLocked(chunk);
        ++cancelled;
    }

    SchedulerEvent event;
    event.type = SchedulerEventType::SessionCancelled;
    event.sessionId = session.id;
    out.events.push_back(std::move(event));

    logMessage(LogLevel::Info, "ProgressiveScheduler: cancelled session '%s' (%zu chunks)", session.id.c_str(),
               cancelled);
}

SessionProgress ProgressiveScheduler::Impl::sessionProgressLocked(const Session& session) const {
    SessionProgress p;
    p.sessionId = session.id;
    p.valid = true;
    p.totalChunks = session.chunkIds.size();
    p.totalImages = session.totalItems;

    for (const std::string& chunkId : session.chunkIds) {
        const ChunkProgress& c = chunks_.at(chunkId).progress;
        switch (c.status) {
            case ChunkStatus::Pending: ++p.pendingChunks; break;
            case ChunkStatus::Loading: ++p.loadingChunks; break;
            case ChunkStatus::Completed: ++p.completedChunks; break;
            case ChunkStatus::Error: ++p.errorChunks; break;
            case ChunkStatus::Cancelled: ++p.cancelledChunks; break;
        }
        p.loadedImages += c.loadedImages;
        p.failedImages += c.failedImages;
        p.totalBytes += c.totalBytes;
        p.loadedBytes += c.bytesLoaded;
    }

    p.percentage = p.totalImages > 0
                       ? static_cast<int>(std::lround(static_cast<double>(p.loadedImages) * 100.0 / p.totalImages))
                       : 0;

    if (session.cancelled) {
        p.status = SessionStatus::Cancelled;
    } else if (!session.queued) {
        p.status = SessionStatus::Pending;
    } else if (p.completedChunks == p.totalChunks) {
        p.status = SessionStatus::Completed;
    } else if (p.errorChunks > 0 && p.loadingChunks == 0) {
        p.status = SessionStatus::Error;
    } else if (p.cancelledChunks > 0 && p.pendingChunks == 0 && p.loadingChunks == 0) {
        p.status = SessionStatus::Cancelled;
    } else {
        p.status = SessionStatus::Loading;
    }
    return p;
}

void ProgressiveScheduler::Impl::notifySessionLocked(Session& session, Notifications& out) {
    SessionProgress progress = sessionProgressLocked(session);
    if (session.onProgress) {
        auto callback = session.onProgress;
        out.callbacks.push_back([callback, progress] { callback(progress); });
    }

    bool settled = session.queued && !session.cancelled && progress.pendingChunks == 0 && progress.loadingChunks == 0;
    if (!settled || session.completionNotified) {
        return;
    }
    session.completionNotified = true;

    SchedulerEvent event;
    event.type = SchedulerEventType::SessionCompleted;
    event.sessionId = session.id;
    out.events.push_back(std::move(event));

    if (session.onComplete) {
        SessionResults results;
        for (const std::string& chunkId : session.chunkIds) {
            auto it = results_.find(chunkId);
            if (it != results_.end()) {
                results[chunkId] = it->second.items;
            }
        }
        auto callback = session.onComplete;
        std::string sessionId = session.id;
        out.callbacks.push_back([callback, sessionId, results] { callback(sessionId, results); });
    }
    logMessage(LogLevel::Info, "ProgressiveScheduler: session '%s' finished status=%s loaded=%zu/%zu",
               session.id.c_str(), sessionStatusName(progress.status), progress.loadedImages, progress.totalImages);
}

size_t ProgressiveScheduler::Impl::evictRetainedLocked(Notifications& out) {
    if (results_.empty()) {
        return 0;
    }
    std::vector<std::pair<uint64_t, std::string>> order;
    order.reserve(results_.size());
    for (const auto& entry : results_) {
        order.emplace_back(entry.second.sequence, entry.first);
    }
    std::sort(order.begin(), order.end());

    size_t count = (order.size() + 3) / 4;
    for (size_t i = 0; i < count; ++i) {
        const std::string& chunkId = order[i].second;
        results_.erase(chunkId);
        ++evictedChunks_;

        SchedulerEvent event;
        event.type = SchedulerEventType::ChunkEvicted;
        event.chunkId = chunkId;
        auto it = chunks_.find(chunkId);
        if (it != chunks_.end()) {
            event.sessionId = it->second.sessionId;
            event.progress = it->second.progress;
        }
        out.events.push_back(std::move(event));
    }
    return count;
}

size_t ProgressiveScheduler::Impl::queuedCountLocked() const {
    size_t n = 0;
    for (const auto& bucket : buckets_) {
        n += bucket.size();
    }
    return n;
}

void ProgressiveScheduler::Impl::deliver(Notifications& notifications) {
    for (const auto& event : notifications.events) {
        events_.emit(event);
    }
    for (auto& callback : notifications.callbacks) {
        try {
            callback();
        } catch (const std::exception& e) {
            logMessage(LogLevel::Warn, "ProgressiveScheduler: callback threw: %s", e.what());
        } catch (...) {
            logMessage(LogLevel::Warn, "ProgressiveScheduler: callback threw a non-standard exception");
        }
    }
    notifications.events.clear();
    notifications.callbacks.clear();
}

SchedulerEvent ProgressiveScheduler::Impl::makeEvent(SchedulerEventType type, const Chunk& chunk) {
    SchedulerEvent event;
    event.type = type;
    event.sessionId = chunk.sessionId;
    event.chunkId = chunk.id;
    event.progress = chunk.progress;
    return event;
}

} // namespace vp_stream
