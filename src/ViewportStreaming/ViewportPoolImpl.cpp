// SPDX-License-Identifier: MIT
// Internal implementation for ViewportPool

#include "ViewportPoolImpl.h"
#include <ViewportStreaming/Logging.h>

#include <algorithm>
#include <cmath>
#include <exception>

namespace vp_stream {

namespace {

ViewportPoolOptions sanitizeOptions(ViewportPoolOptions options) {
    if (options.maxPoolSize == 0) {
        logMessage(LogLevel::Warn, "ViewportPool: maxPoolSize 0 raised to 1");
        options.maxPoolSize = 1;
    }
    if (options.minPoolSize > options.maxPoolSize) {
        logMessage(LogLevel::Warn, "ViewportPool: minPoolSize %zu clamped to maxPoolSize %zu",
                   options.minPoolSize, options.maxPoolSize);
        options.minPoolSize = options.maxPoolSize;
    }
    size_t initial = std::min(std::max(options.initialPoolSize, options.minPoolSize), options.maxPoolSize);
    if (initial != options.initialPoolSize) {
        logMessage(LogLevel::Warn, "ViewportPool: initialPoolSize %zu clamped to %zu",
                   options.initialPoolSize, initial);
        options.initialPoolSize = initial;
    }
    return options;
}

} // namespace

const char* slotStateName(SlotState state) {
    switch (state) {
        case SlotState::Available: return "available";
        case SlotState::InUse: return "in-use";
        case SlotState::PendingCleanup: return "pending-cleanup";
        case SlotState::Disposed: return "disposed";
        default: return "unknown";
    }
}

ViewportPool::Impl::Impl(const ViewportPoolOptions& options, std::shared_ptr<SlotBackend> backend,
                         std::shared_ptr<PressureSource> pressure)
    : options_(sanitizeOptions(options))
    , backend_(std::move(backend))
    , memory_(std::move(pressure), options_.pressureThreshold)
    , events_("ViewportPool")
    , timers_("ViewportPool")
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < options_.initialPoolSize; ++i) {
            createSlotLocked(ContentType::Stack);
        }
    }

    if (options_.enableGarbageCollection && options_.gcInterval.count() > 0) {
        timers_.scheduleRepeating(options_.gcInterval, [this] { runGarbageCollection(); });
    }
    if (options_.memoryCheckInterval.count() > 0) {
        timers_.scheduleRepeating(options_.memoryCheckInterval, [this] { checkMemoryPressure(); });
    }

    logMessage(LogLevel::Info, "ViewportPool: initialized size=%zu min=%zu max=%zu",
               options_.initialPoolSize, options_.minPoolSize, options_.maxPoolSize);
}

ViewportPool::Impl::~Impl() {
    dispose();
}

ViewportHandle ViewportPool::Impl::acquire(ContentType type, const std::string& contentId) {
    ViewportHandle handle;
    handle.type = type;
    handle.contentId = contentId;

    EventList events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            handle.error = lastError_ = LoadingError::Disposed;
            return handle;
        }
        if (contentId.empty()) {
            logMessage(LogLevel::Error, "ViewportPool::acquire: empty content id");
            handle.error = lastError_ = LoadingError::InvalidParameter;
            return handle;
        }
        if (contentInUseLocked(contentId)) {
            logMessage(LogLevel::Warn, "ViewportPool::acquire: content '%s' already bound to a slot",
                       contentId.c_str());
            handle.error = lastError_ = LoadingError::DuplicateContent;
            return handle;
        }

        Slot* slot = findReclaimableLocked(type, contentId);
        if (slot) {
            timers_.cancel(slot->cleanupTimer);
            slot->cleanupTimer = internal::TimerQueue::kInvalidTimer;
            ++reclaimCount_;
            logMessage(LogLevel::Debug, "ViewportPool::acquire: reclaimed slot %u for '%s'",
                       slot->poolId, contentId.c_str());
        }
        if (!slot) {
            slot = findAvailableLocked(type);
        }
        if (!slot && shouldExpandLocked()) {
            slot = createSlotLocked(type);
            if (slot) {
                logMessage(LogLevel::Info, "ViewportPool::acquire: expanded pool to %zu", slots_.size());
            }
        }
        if (!slot) {
            slot = recycleLocked(type, events);
        }
        if (!slot) {
            logMessage(LogLevel::Warn, "ViewportPool::acquire: no slot for type=%s size=%zu inUse=%zu",
                       contentTypeName(type), slots_.size(), countStateLocked(SlotState::InUse));
            handle.error = lastError_ = LoadingError::PoolExhausted;
            return handle;
        }

        markInUseLocked(*slot, contentId);
        handle.poolId = slot->poolId;
        handle.valid = true;
        handle.resources = slot->resources;
        handle.error = lastError_ = LoadingError::Success;
        events.push_back(makeEvent(PoolEventType::Acquired, *slot));

        logMessage(LogLevel::Debug, "ViewportPool::acquire: slot %u -> '%s' (usage=%llu)", slot->poolId,
                   contentId.c_str(), static_cast<unsigned long long>(slot->usageCount));
    }
    emitAll(events);
    return handle;
}

bool ViewportPool::Impl::release(uint32_t poolId) {
    EventList events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            lastError_ = LoadingError::Disposed;
            return false;
        }
        auto it = slots_.find(poolId);
        if (it == slots_.end()) {
            logMessage(LogLevel::Warn, "ViewportPool::release: unknown slot %u", poolId);
            lastError_ = LoadingError::NotFound;
            return false;
        }
        Slot& slot = it->second;
        if (slot.state != SlotState::InUse) {
            logMessage(LogLevel::Warn, "ViewportPool::release: slot %u is %s, not in use", poolId,
                       slotStateName(slot.state));
            lastError_ = LoadingError::InvalidState;
            return false;
        }

        events.push_back(makeEvent(PoolEventType::Released, slot));

        slot.state = SlotState::PendingCleanup;
        slot.lastContentId = std::move(slot.contentId);
        slot.contentId.clear();
        slot.lastUsedAt = Clock::now();
        uint64_t generation = ++slot.cleanupGeneration;
        slot.cleanupTimer = timers_.schedule(options_.cleanupDelay, [this, poolId, generation] {
            completeCleanup(poolId, generation);
        });
        lastError_ = LoadingError::Success;

        logMessage(LogLevel::Debug, "ViewportPool::release: slot %u pending cleanup", poolId);
    }
    emitAll(events);
    return true;
}

void ViewportPool::Impl::completeCleanup(uint32_t poolId, uint64_t generation) {
    EventList events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        auto it = slots_.find(poolId);
        if (it == slots_.end()) {
            return;
        }
        Slot& slot = it->second;
        // Reclaimed or released again since this timer was armed
        if (slot.state != SlotState::PendingCleanup || slot.cleanupGeneration != generation) {
            return;
        }

        resetSlotLocked(slot, slot.type);
        slot.lastContentId.clear();
        slot.cleanupTimer = internal::TimerQueue::kInvalidTimer;
        slot.state = SlotState::Available;
        availableQueue_.push_back(poolId);
        events.push_back(makeEvent(PoolEventType::CleanupCompleted, slot));

        logMessage(LogLevel::Debug, "ViewportPool: cleanup completed for slot %u", poolId);
    }
    emitAll(events);
}

GarbageCollectionResult ViewportPool::Impl::runGarbageCollection() {
    EventList events;
    GarbageCollectionResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            result.errors.push_back("pool disposed");
            return result;
        }
        result = collectLocked(events);
    }
    PoolEvent done;
    done.type = PoolEventType::GcCompleted;
    done.gc = result;
    events.push_back(std::move(done));
    emitAll(events);
    return result;
}

bool ViewportPool::Impl::checkMemoryPressure() {
    EventList events;
    GarbageCollectionResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return false;
        }
        size_t estimate = estimateMemoryLocked();
        bool overBudget = estimate > options_.maxMemoryUsage;
        bool overPressure = memory_.isOverThreshold();
        if (!overBudget && !overPressure) {
            return false;
        }

        logMessage(LogLevel::Warn, "ViewportPool: memory pressure (estimate=%zu max=%zu reading=%.2f), cleaning up",
                   estimate, options_.maxMemoryUsage, memory_.getCurrentUsage());
        size_t removed = aggressiveCleanupLocked(events);
        result = collectLocked(events);
        result.cleanedViewports += removed;
        result.freedMemory = result.cleanedViewports * options_.bytesPerViewport;
    }
    PoolEvent done;
    done.type = PoolEventType::GcCompleted;
    done.gc = result;
    events.push_back(std::move(done));
    emitAll(events);
    return true;
}

PooledViewport ViewportPool::Impl::getSlot(uint32_t poolId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(poolId);
    if (it == slots_.end()) {
        PooledViewport missing;
        missing.poolId = poolId;
        return missing;
    }
    return snapshot(it->second);
}

std::vector<PooledViewport> ViewportPool::Impl::getSlots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PooledViewport> out;
    out.reserve(slots_.size());
    for (const auto& entry : slots_) {
        out.push_back(snapshot(entry.second));
    }
    return out;
}

size_t ViewportPool::Impl::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

size_t ViewportPool::Impl::estimateMemoryUsage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return estimateMemoryLocked();
}

PoolStatistics ViewportPool::Impl::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStatistics stats;
    stats.totalViewports = slots_.size();
    stats.availableViewports = countStateLocked(SlotState::Available);
    stats.inUseViewports = countStateLocked(SlotState::InUse);
    stats.pendingCleanup = countStateLocked(SlotState::PendingCleanup);
    stats.recycleCount = recycleCount_;
    stats.reclaimCount = reclaimCount_;
    stats.disposedCount = disposedCount_;
    stats.gcRunCount = gcRunCount_;
    stats.memoryUsage = estimateMemoryLocked();
    stats.lastGcTime = lastGcTime_;
    stats.poolEfficiency = efficiencyLocked();
    return stats;
}

PoolHealth ViewportPool::Impl::getHealthStatus() const {
    PoolStatistics stats = getStatistics();
    PoolHealth health;

    if (stats.poolEfficiency < 50.0) {
        health.issues.push_back("Low pool efficiency: slots are disposed more often than reused");
        health.recommendations.push_back("Increase maxIdleTime or adjust the pool size bounds");
    }
    if (static_cast<double>(stats.memoryUsage) > static_cast<double>(options_.maxMemoryUsage) * 0.9) {
        health.issues.push_back("Memory usage approaching limit");
        health.recommendations.push_back("Reduce pool size or run garbage collection");
    }

    double utilization = stats.totalViewports > 0
                             ? static_cast<double>(stats.inUseViewports) / stats.totalViewports
                             : 0.0;
    if (utilization > 0.9) {
        health.issues.push_back("High pool utilization");
        health.recommendations.push_back("Increase maxPoolSize");
    } else if (utilization < 0.1 && stats.totalViewports > options_.minPoolSize) {
        health.issues.push_back("Low pool utilization");
        health.recommendations.push_back("Decrease pool size or shrinkThreshold");
    }

    health.healthy = health.issues.empty();
    return health;
}

LoadingError ViewportPool::Impl::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

ViewportPool::SubscriptionId ViewportPool::Impl::subscribe(std::function<void(const PoolEvent&)> listener) {
    return events_.subscribe(std::move(listener));
}

bool ViewportPool::Impl::unsubscribe(SubscriptionId id) {
    return events_.unsubscribe(id);
}

void ViewportPool::Impl::dispose() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
        lastError_ = LoadingError::Disposed;
    }

    // Join the timer thread outside the lock; pending callbacks see disposed_
    timers_.shutdown();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : slots_) {
            Slot& slot = entry.second;
            if (backend_) {
                try {
                    backend_->destroySlot(slot.poolId, slot.resources);
                } catch (const std::exception& e) {
                    logMessage(LogLevel::Error, "ViewportPool::dispose: destroySlot(%u) threw: %s",
                               slot.poolId, e.what());
                }
            }
            slot.state = SlotState::Disposed;
        }
        slots_.clear();
        availableQueue_.clear();
    }
    events_.clear();
    logMessage(LogLevel::Info, "ViewportPool: disposed");
}

bool ViewportPool::Impl::isDisposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

// ---------------------------------------------------------------------------
// Slot management
// ---------------------------------------------------------------------------

ViewportPool::Impl::Slot* ViewportPool::Impl::createSlotLocked(ContentType type) {
    if (slots_.size() >= options_.maxPoolSize) {
        return nullptr;
    }
    Slot slot;
    slot.poolId = nextPoolId_++;
    slot.type = type;
    slot.createdAt = Clock::now();
    if (backend_) {
        try {
            slot.resources = backend_->createSlot(slot.poolId, type);
        } catch (const std::exception& e) {
            logMessage(LogLevel::Error, "ViewportPool: createSlot(%u) threw: %s", slot.poolId, e.what());
            lastError_ = LoadingError::BackendError;
            return nullptr;
        }
    }
    uint32_t id = slot.poolId;
    auto inserted = slots_.emplace(id, std::move(slot));
    availableQueue_.push_back(id);
    logMessage(LogLevel::Debug, "ViewportPool: created slot %u type=%s", id, contentTypeName(type));
    return &inserted.first->second;
}

void ViewportPool::Impl::removeSlotLocked(uint32_t poolId, EventList& events, std::vector<std::string>* errors) {
    auto it = slots_.find(poolId);
    if (it == slots_.end() || it->second.state == SlotState::InUse) {
        return;
    }
    Slot& slot = it->second;
    timers_.cancel(slot.cleanupTimer);
    if (backend_) {
        try {
            backend_->destroySlot(slot.poolId, slot.resources);
        } catch (const std::exception& e) {
            logMessage(LogLevel::Error, "ViewportPool: destroySlot(%u) threw: %s", poolId, e.what());
            if (errors) {
                errors->push_back("slot " + std::to_string(poolId) + ": " + e.what());
            }
        }
    }
    slot.state = SlotState::Disposed;
    events.push_back(makeEvent(PoolEventType::Removed, slot));

    availableQueue_.erase(std::remove(availableQueue_.begin(), availableQueue_.end(), poolId),
                          availableQueue_.end());
    slots_.erase(it);
    ++disposedCount_;
    logMessage(LogLevel::Debug, "ViewportPool: removed slot %u", poolId);
}

ViewportPool::Impl::Slot* ViewportPool::Impl::findAvailableLocked(ContentType type) {
    for (uint32_t id : availableQueue_) {
        auto it = slots_.find(id);
        if (it != slots_.end() && it->second.state == SlotState::Available && it->second.type == type) {
            return &it->second;
        }
    }
    return nullptr;
}

ViewportPool::Impl::Slot* ViewportPool::Impl::findReclaimableLocked(ContentType type, const std::string& contentId) {
    for (auto& entry : slots_) {
        Slot& slot = entry.second;
        if (slot.state == SlotState::PendingCleanup && slot.type == type && slot.lastContentId == contentId) {
            return &slot;
        }
    }
    return nullptr;
}

ViewportPool::Impl::Slot* ViewportPool::Impl::recycleLocked(ContentType type, EventList& events) {
    Slot* oldest = nullptr;
    for (uint32_t id : availableQueue_) {
        auto it = slots_.find(id);
        if (it == slots_.end() || it->second.state != SlotState::Available || it->second.type == type) {
            continue;
        }
        if (!oldest || it->second.lastUsedAt < oldest->lastUsedAt) {
            oldest = &it->second;
        }
    }
    if (!oldest) {
        return nullptr;
    }

    ContentType previous = oldest->type;
    resetSlotLocked(*oldest, type);
    oldest->type = type;
    ++recycleCount_;
    events.push_back(makeEvent(PoolEventType::Recycled, *oldest));
    logMessage(LogLevel::Info, "ViewportPool: recycled slot %u %s -> %s", oldest->poolId,
               contentTypeName(previous), contentTypeName(type));
    return oldest;
}

bool ViewportPool::Impl::shouldExpandLocked() const {
    if (!options_.enableAutoScaling || slots_.size() >= options_.maxPoolSize) {
        return false;
    }
    if (slots_.empty()) {
        return true;
    }
    double utilization = static_cast<double>(countStateLocked(SlotState::InUse)) / slots_.size();
    return utilization >= options_.expandThreshold;
}

bool ViewportPool::Impl::contentInUseLocked(const std::string& contentId) const {
    for (const auto& entry : slots_) {
        if (entry.second.state == SlotState::InUse && entry.second.contentId == contentId) {
            return true;
        }
    }
    return false;
}

void ViewportPool::Impl::markInUseLocked(Slot& slot, const std::string& contentId) {
    availableQueue_.erase(std::remove(availableQueue_.begin(), availableQueue_.end(), slot.poolId),
                          availableQueue_.end());
    slot.state = SlotState::InUse;
    slot.contentId = contentId;
    slot.lastContentId.clear();
    slot.lastUsedAt = Clock::now();
    ++slot.usageCount;
}

void ViewportPool::Impl::resetSlotLocked(Slot& slot, ContentType type) {
    if (!backend_) {
        return;
    }
    try {
        backend_->resetSlot(slot.poolId, type, slot.resources);
    } catch (const std::exception& e) {
        // The slot still goes back into circulation
        logMessage(LogLevel::Error, "ViewportPool: resetSlot(%u) threw: %s", slot.poolId, e.what());
    }
}

size_t ViewportPool::Impl::countStateLocked(SlotState state) const {
    size_t n = 0;
    for (const auto& entry : slots_) {
        if (entry.second.state == state) {
            ++n;
        }
    }
    return n;
}

size_t ViewportPool::Impl::estimateMemoryLocked() const {
    size_t total = 0;
    for (const auto& entry : slots_) {
        if (entry.second.state == SlotState::InUse) {
            total += options_.bytesPerViewport * 2;
        } else {
            total += options_.bytesPerViewport / 2;
        }
    }
    return total;
}

double ViewportPool::Impl::efficiencyLocked() const {
    uint64_t reused = recycleCount_ + reclaimCount_;
    uint64_t attempts = reused + disposedCount_;
    if (attempts == 0) {
        return 100.0;
    }
    return static_cast<double>(reused) / static_cast<double>(attempts) * 100.0;
}

GarbageCollectionResult ViewportPool::Impl::collectLocked(EventList& events) {
    TimePoint start = Clock::now();
    GarbageCollectionResult result;

    // Idle slots, longest idle first; slots that were never used are not idle
    std::vector<const Slot*> idle;
    for (const auto& entry : slots_) {
        const Slot& slot = entry.second;
        if (slot.state == SlotState::Available && slot.usageCount > 0 &&
            elapsedMs(slot.lastUsedAt, start) > options_.maxIdleTime.count()) {
            idle.push_back(&slot);
        }
    }
    std::sort(idle.begin(), idle.end(), [](const Slot* a, const Slot* b) { return a->lastUsedAt < b->lastUsedAt; });

    std::vector<uint32_t> toRemove;
    for (const Slot* slot : idle) {
        if (slots_.size() - toRemove.size() <= options_.minPoolSize) {
            break;
        }
        toRemove.push_back(slot->poolId);
    }
    for (uint32_t id : toRemove) {
        removeSlotLocked(id, events, &result.errors);
        ++result.cleanedViewports;
    }

    // Shrink an underused pool
    if (options_.enableAutoScaling && options_.shrinkThreshold > 0.0 && slots_.size() > options_.minPoolSize) {
        size_t inUse = countStateLocked(SlotState::InUse);
        double utilization = static_cast<double>(inUse) / slots_.size();
        if (utilization <= options_.shrinkThreshold) {
            std::vector<const Slot*> candidates;
            for (const auto& entry : slots_) {
                if (entry.second.state == SlotState::Available) {
                    candidates.push_back(&entry.second);
                }
            }
            std::sort(candidates.begin(), candidates.end(), [](const Slot* a, const Slot* b) {
                if (a->usageCount != b->usageCount) return a->usageCount < b->usageCount;
                return a->createdAt < b->createdAt;
            });

            size_t target = std::max(options_.minPoolSize,
                                     static_cast<size_t>(std::ceil(inUse / options_.shrinkThreshold)));
            size_t excess = slots_.size() > target ? slots_.size() - target : 0;
            size_t count = std::min(excess, candidates.size());

            std::vector<uint32_t> shrinkIds;
            for (size_t i = 0; i < count; ++i) {
                shrinkIds.push_back(candidates[i]->poolId);
            }
            for (uint32_t id : shrinkIds) {
                removeSlotLocked(id, events, &result.errors);
                ++result.cleanedViewports;
            }
            if (count > 0) {
                logMessage(LogLevel::Info, "ViewportPool: shrunk pool by %zu to %zu", count, slots_.size());
            }
        }
    }

    result.freedMemory = result.cleanedViewports * options_.bytesPerViewport;
    ++gcRunCount_;
    lastGcTime_ = Clock::now();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(lastGcTime_ - start);

    logMessage(LogLevel::Info, "ViewportPool: gc cleaned=%zu freed=%zu size=%zu errors=%zu",
               result.cleanedViewports, result.freedMemory, slots_.size(), result.errors.size());
    return result;
}

size_t ViewportPool::Impl::aggressiveCleanupLocked(EventList& events) {
    std::vector<uint32_t> available(availableQueue_.begin(), availableQueue_.end());
    size_t removed = 0;
    for (uint32_t id : available) {
        if (slots_.size() <= options_.minPoolSize) {
            break;
        }
        removeSlotLocked(id, events, nullptr);
        ++removed;
    }
    return removed;
}

void ViewportPool::Impl::emitAll(const EventList& events) {
    for (const auto& event : events) {
        events_.emit(event);
    }
}

PoolEvent ViewportPool::Impl::makeEvent(PoolEventType type, const Slot& slot) {
    PoolEvent event;
    event.type = type;
    event.poolId = slot.poolId;
    event.contentType = slot.type;
    event.contentId = slot.contentId;
    return event;
}

PooledViewport ViewportPool::Impl::snapshot(const Slot& slot) {
    PooledViewport out;
    out.poolId = slot.poolId;
    out.valid = true;
    out.state = slot.state;
    out.type = slot.type;
    out.createdAt = slot.createdAt;
    out.lastUsedAt = slot.lastUsedAt;
    out.usageCount = slot.usageCount;
    out.contentId = slot.contentId;
    out.resources = slot.resources;
    return out;
}

} // namespace vp_stream
