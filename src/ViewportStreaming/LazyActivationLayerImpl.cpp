// SPDX-License-Identifier: MIT
// Internal implementation for LazyActivationLayer

#include "LazyActivationLayerImpl.h"
#include "Internal/Adjacency.h"
#include <ViewportStreaming/Logging.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace vp_stream {

namespace {

constexpr size_t kMaxAccessHistory = 100;
constexpr size_t kTrimmedAccessHistory = 50;

ActivationOptions sanitizeOptions(ActivationOptions options) {
    if (options.maxActiveViewports == 0) {
        logMessage(LogLevel::Warn, "LazyActivationLayer: maxActiveViewports 0 raised to 1");
        options.maxActiveViewports = 1;
    }
    if (options.maxDeactivationsPerAttempt == 0) {
        options.maxDeactivationsPerAttempt = 1;
    }
    if (options.predictionWindow == 0) {
        options.predictionWindow = 1;
    }
    return options;
}

} // namespace

const char* viewportStateName(ViewportState state) {
    switch (state) {
        case ViewportState::Uninitialized: return "uninitialized";
        case ViewportState::Initializing: return "initializing";
        case ViewportState::Ready: return "ready";
        case ViewportState::Error: return "error";
        case ViewportState::Disposed: return "disposed";
        default: return "unknown";
    }
}

LazyActivationLayer::Impl::Impl(const ActivationOptions& options, std::shared_ptr<ViewportMaterializer> materializer,
                                std::shared_ptr<ViewportPool> pool)
    : options_(sanitizeOptions(options))
    , materializer_(std::move(materializer))
    , pool_(std::move(pool))
    , predictiveEnabled_(options_.enablePredictiveLoading)
    , events_("LazyActivationLayer")
    , workers_(2, "LazyActivationLayer")
    , timers_("LazyActivationLayer")
{
    if (options_.predictionInterval.count() > 0) {
        timers_.scheduleRepeating(options_.predictionInterval, [this] { analyzePredictivePatterns(); });
    }
    if (options_.memoryCheckInterval.count() > 0) {
        timers_.scheduleRepeating(options_.memoryCheckInterval, [this] { checkMemory(); });
    }
    logMessage(LogLevel::Info, "LazyActivationLayer: initialized maxActive=%zu pool=%s",
               options_.maxActiveViewports, pool_ ? "yes" : "no");
}

LazyActivationLayer::Impl::~Impl() {
    dispose();
}

bool LazyActivationLayer::Impl::registerViewport(const std::string& viewportId, const ViewportMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        lastError_ = LoadingError::Disposed;
        return false;
    }
    if (viewportId.empty()) {
        logMessage(LogLevel::Error, "LazyActivationLayer::registerViewport: empty id");
        lastError_ = LoadingError::InvalidParameter;
        return false;
    }
    if (instances_.count(viewportId)) {
        logMessage(LogLevel::Warn, "LazyActivationLayer::registerViewport: '%s' already registered",
                   viewportId.c_str());
        lastError_ = LoadingError::AlreadyExists;
        return false;
    }

    Instance instance;
    instance.id = viewportId;
    instance.serial = nextSerial_++;
    instance.metadata = metadata;
    instances_.emplace(viewportId, std::move(instance));
    lastError_ = LoadingError::Success;

    logMessage(LogLevel::Debug, "LazyActivationLayer::registerViewport: '%s'", viewportId.c_str());
    return true;
}

bool LazyActivationLayer::Impl::unregisterViewport(const std::string& viewportId) {
    TeardownList teardowns;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(viewportId);
        if (it == instances_.end()) {
            lastError_ = LoadingError::NotFound;
            return false;
        }
        Instance& instance = it->second;
        clearInactivityTimerLocked(instance);
        if (instance.state == ViewportState::Ready) {
            teardownLocked(instance, teardowns);
        }
        // An in-flight activation notices the missing entry and tears down on its own
        instances_.erase(it);
        lastError_ = LoadingError::Success;
        logMessage(LogLevel::Debug, "LazyActivationLayer::unregisterViewport: '%s'", viewportId.c_str());
    }
    stateCv_.notify_all();
    runTeardowns(teardowns);
    return true;
}

bool LazyActivationLayer::Impl::activateViewport(const std::string& viewportId, SurfaceHandle surface, bool immediate) {
    EventList events;
    TeardownList teardowns;
    uint64_t serial = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (disposed_) {
            lastError_ = LoadingError::Disposed;
            return false;
        }
        // A previous deactivation of this id must finish before it is built again
        bool drained = stateCv_.wait_for(lock, options_.activationWaitTimeout, [&] {
            return disposed_ || teardownsInFlight_.count(viewportId) == 0;
        });
        if (disposed_) {
            lastError_ = LoadingError::Disposed;
            return false;
        }
        if (!drained) {
            logMessage(LogLevel::Warn, "LazyActivationLayer::activateViewport: teardown of '%s' still running",
                       viewportId.c_str());
            lastError_ = LoadingError::Timeout;
            return false;
        }
        Instance* instance = findLocked(viewportId);
        if (!instance) {
            logMessage(LogLevel::Error, "LazyActivationLayer::activateViewport: '%s' not registered",
                       viewportId.c_str());
            lastError_ = LoadingError::NotFound;
            return false;
        }

        if (instance->state == ViewportState::Ready) {
            touchLocked(*instance, true);
            return true;
        }

        if (instance->state == ViewportState::Initializing) {
            // Join the in-flight activation instead of starting a second one
            const uint64_t waitSerial = instance->serial;
            logMessage(LogLevel::Debug, "LazyActivationLayer::activateViewport: joining '%s'", viewportId.c_str());
            bool settled = stateCv_.wait_for(lock, options_.activationWaitTimeout, [&] {
                const Instance* current = findLocked(viewportId);
                return disposed_ || !current || current->serial != waitSerial ||
                       current->state != ViewportState::Initializing;
            });
            Instance* current = findLocked(viewportId);
            if (disposed_) {
                lastError_ = LoadingError::Disposed;
                return false;
            }
            if (!settled) {
                logMessage(LogLevel::Warn, "LazyActivationLayer::activateViewport: timed out waiting for '%s'",
                           viewportId.c_str());
                lastError_ = LoadingError::Timeout;
                return false;
            }
            if (!current || current->serial != waitSerial || current->state != ViewportState::Ready) {
                lastError_ = LoadingError::InvalidState;
                return false;
            }
            touchLocked(*current, true);
            return true;
        }

        if (!immediate && !canActivateLocked()) {
            logMessage(LogLevel::Info, "LazyActivationLayer::activateViewport: '%s' over limits (active=%zu), freeing",
                       viewportId.c_str(), activeCountLocked());
            freeUpResourcesLocked(events, teardowns);
            if (!canActivateLocked()) {
                logMessage(LogLevel::Warn, "LazyActivationLayer::activateViewport: '%s' not admitted",
                           viewportId.c_str());
                lastError_ = LoadingError::AdmissionDenied;
                lock.unlock();
                runTeardowns(teardowns);
                emitAll(events);
                return false;
            }
        }

        // Uninitialized and Error both start a fresh attempt
        instance->state = ViewportState::Initializing;
        instance->preloaded = false;
        if (surface) {
            instance->surface = surface;
        }
        surface = instance->surface;
        serial = instance->serial;
    }
    runTeardowns(teardowns);
    emitAll(events);
    return materialize(viewportId, serial, surface, Origin::Caller);
}

bool LazyActivationLayer::Impl::preloadViewport(const std::string& viewportId) {
    uint64_t serial = 0;
    SurfaceHandle surface = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return false;
        }
        Instance* instance = findLocked(viewportId);
        if (!instance || instance->state != ViewportState::Uninitialized || teardownsInFlight_.count(viewportId) ||
            !canActivateLocked()) {
            return false;
        }
        instance->state = ViewportState::Initializing;
        serial = instance->serial;
        surface = instance->surface;
    }
    logMessage(LogLevel::Debug, "LazyActivationLayer::preloadViewport: '%s'", viewportId.c_str());
    return materialize(viewportId, serial, surface, Origin::Preload);
}

bool LazyActivationLayer::Impl::materialize(const std::string& viewportId, uint64_t serial, SurfaceHandle surface,
                                            Origin origin) {
    ViewportHandle slot;
    if (pool_) {
        slot = pool_->acquire(options_.slotType, viewportId);
        if (!slot.valid) {
            logMessage(LogLevel::Warn, "LazyActivationLayer: no pool slot for '%s': %s", viewportId.c_str(),
                       getErrorString(slot.error));
            {
                std::lock_guard<std::mutex> lock(mutex_);
                Instance* instance = findLocked(viewportId);
                if (instance && instance->serial == serial && instance->state == ViewportState::Initializing) {
                    instance->state = ViewportState::Uninitialized;
                }
                lastError_ = LoadingError::AdmissionDenied;
            }
            stateCv_.notify_all();
            return false;
        }
    }

    bool ok = true;
    if (materializer_) {
        try {
            ok = materializer_->materialize(viewportId, surface, slot);
        } catch (const std::exception& e) {
            logMessage(LogLevel::Error, "LazyActivationLayer: materialize('%s') threw: %s", viewportId.c_str(), e.what());
            ok = false;
        }
    }

    EventList events;
    TeardownList teardowns;
    bool ready = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Instance* instance = findLocked(viewportId);
        bool current = !disposed_ && instance && instance->serial == serial &&
                       instance->state == ViewportState::Initializing;
        if (!current) {
            // Unregistered or disposed while materializing
            Teardown teardown;
            teardown.viewportId = viewportId;
            teardown.dematerialize = ok;
            teardown.slot = slot;
            scheduleTeardownLocked(std::move(teardown), teardowns);
            lastError_ = disposed_ ? LoadingError::Disposed : LoadingError::NotFound;
        } else if (!ok) {
            Teardown teardown;
            teardown.viewportId = viewportId;
            teardown.dematerialize = false;
            teardown.slot = slot;
            scheduleTeardownLocked(std::move(teardown), teardowns);
            instance->state = ViewportState::Error;
            lastError_ = LoadingError::BackendError;
            events.push_back(ActivationEvent{ActivationEventType::Error, viewportId});
            logMessage(LogLevel::Error, "LazyActivationLayer: activation of '%s' failed", viewportId.c_str());
        } else {
            instance->state = ViewportState::Ready;
            instance->slot = slot;
            if (origin == Origin::Caller) {
                touchLocked(*instance, true);
                events.push_back(ActivationEvent{ActivationEventType::Ready, viewportId});
            } else {
                instance->preloaded = true;
                instance->lastAccessTime = Clock::now();
                armInactivityTimerLocked(*instance);
                events.push_back(ActivationEvent{ActivationEventType::Preloaded, viewportId});
            }
            lastError_ = LoadingError::Success;
            ready = true;
            logMessage(LogLevel::Info, "LazyActivationLayer: '%s' ready (%s, active=%zu)", viewportId.c_str(),
                       origin == Origin::Caller ? "activated" : "preloaded", activeCountLocked());
        }
    }
    stateCv_.notify_all();
    runTeardowns(teardowns);
    emitAll(events);

    if (ready && origin == Origin::Caller && options_.preloadAdjacent) {
        scheduleAdjacentPreloads(viewportId);
    }
    return ready;
}

bool LazyActivationLayer::Impl::deactivateViewport(const std::string& viewportId) {
    EventList events;
    TeardownList teardowns;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Instance* instance = findLocked(viewportId);
        if (!instance || instance->state != ViewportState::Ready) {
            return false;
        }
        deactivateLocked(*instance, events, teardowns);
    }
    runTeardowns(teardowns);
    emitAll(events);
    return true;
}

ViewportInfo LazyActivationLayer::Impl::getViewportState(const std::string& viewportId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ViewportInfo info;
    info.id = viewportId;
    const Instance* instance = findLocked(viewportId);
    if (!instance) {
        return info;
    }
    info.valid = true;
    info.state = instance->state;
    info.lastAccessTime = instance->lastAccessTime;
    info.accessCount = instance->accessCount;
    info.priority = instance->priority;
    info.preloaded = instance->preloaded;
    info.surface = instance->surface;
    info.poolId = instance->slot.valid ? instance->slot.poolId : 0;
    info.metadata = instance->metadata;
    return info;
}

std::vector<std::string> LazyActivationLayer::Impl::getActiveViewports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& entry : instances_) {
        if (entry.second.state == ViewportState::Ready) {
            out.push_back(entry.first);
        }
    }
    return out;
}

std::vector<std::string> LazyActivationLayer::Impl::getLoadingQueue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& entry : instances_) {
        if (entry.second.state == ViewportState::Initializing) {
            out.push_back(entry.first);
        }
    }
    return out;
}

MemoryUsage LazyActivationLayer::Impl::getMemoryUsage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MemoryUsage usage;
    usage.threshold = options_.memoryThreshold;
    for (const auto& entry : instances_) {
        if (entry.second.state == ViewportState::Ready) {
            usage.viewports[entry.first] = options_.bytesPerViewport;
            usage.used += options_.bytesPerViewport;
        }
    }
    return usage;
}

std::vector<ViewportPrediction> LazyActivationLayer::Impl::predictNextViewports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ViewportPrediction> predictions;

    size_t window = std::min(options_.predictionWindow, accessHistory_.size());
    std::map<std::string, size_t> counts;
    for (auto it = accessHistory_.end() - static_cast<std::ptrdiff_t>(window); it != accessHistory_.end(); ++it) {
        ++counts[*it];
    }

    for (const auto& entry : instances_) {
        const Instance& instance = entry.second;
        if (instance.state == ViewportState::Ready || instance.state == ViewportState::Initializing) {
            continue;
        }
        auto hit = counts.find(entry.first);
        if (hit == counts.end()) {
            continue;
        }
        ViewportPrediction prediction;
        prediction.viewportId = entry.first;
        prediction.probability = static_cast<double>(hit->second) / static_cast<double>(std::max<size_t>(window, 1));
        prediction.reason = "recent access frequency";
        prediction.suggestedPreloadDelay = options_.predictivePreloadDelay;
        predictions.push_back(std::move(prediction));
    }

    std::stable_sort(predictions.begin(), predictions.end(),
                     [](const ViewportPrediction& a, const ViewportPrediction& b) { return a.probability > b.probability; });
    return predictions;
}

LoadingError LazyActivationLayer::Impl::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

void LazyActivationLayer::Impl::setViewportPriority(const std::string& viewportId, int priority) {
    std::lock_guard<std::mutex> lock(mutex_);
    Instance* instance = findLocked(viewportId);
    if (instance) {
        instance->priority = priority;
    }
}

void LazyActivationLayer::Impl::setPredictiveLoading(bool enabled) {
    predictiveEnabled_.store(enabled);
    logMessage(LogLevel::Debug, "LazyActivationLayer: predictive loading %s", enabled ? "on" : "off");
}

bool LazyActivationLayer::Impl::isPredictiveLoadingEnabled() const {
    return predictiveEnabled_.load();
}

LazyActivationLayer::SubscriptionId LazyActivationLayer::Impl::subscribe(
    std::function<void(const ActivationEvent&)> listener) {
    return events_.subscribe(std::move(listener));
}

bool LazyActivationLayer::Impl::unsubscribe(SubscriptionId id) {
    return events_.unsubscribe(id);
}

void LazyActivationLayer::Impl::dispose() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
        lastError_ = LoadingError::Disposed;
    }
    stateCv_.notify_all();

    timers_.shutdown();
    // Running preloads finish here and tear down what they built
    workers_.shutdown();

    TeardownList teardowns;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : instances_) {
            Instance& instance = entry.second;
            if (instance.state == ViewportState::Ready) {
                teardownLocked(instance, teardowns);
            }
            instance.state = ViewportState::Disposed;
        }
        instances_.clear();
        accessHistory_.clear();
    }
    runTeardowns(teardowns);
    events_.clear();
    logMessage(LogLevel::Info, "LazyActivationLayer: disposed");
}

bool LazyActivationLayer::Impl::isDisposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

LazyActivationLayer::Impl::Instance* LazyActivationLayer::Impl::findLocked(const std::string& viewportId) {
    auto it = instances_.find(viewportId);
    return it == instances_.end() ? nullptr : &it->second;
}

const LazyActivationLayer::Impl::Instance* LazyActivationLayer::Impl::findLocked(const std::string& viewportId) const {
    auto it = instances_.find(viewportId);
    return it == instances_.end() ? nullptr : &it->second;
}

size_t LazyActivationLayer::Impl::activeCountLocked() const {
    size_t n = 0;
    for (const auto& entry : instances_) {
        if (entry.second.state == ViewportState::Ready || entry.second.state == ViewportState::Initializing) {
            ++n;
        }
    }
    return n;
}

bool LazyActivationLayer::Impl::canActivateLocked() const {
    size_t active = activeCountLocked();
    return active < options_.maxActiveViewports && active * options_.bytesPerViewport < options_.memoryThreshold;
}

void LazyActivationLayer::Impl::freeUpResourcesLocked(EventList& events, TeardownList& teardowns) {
    std::vector<Instance*> ready;
    for (auto& entry : instances_) {
        if (entry.second.state == ViewportState::Ready) {
            ready.push_back(&entry.second);
        }
    }
    // Lowest priority first, then least recently used
    std::sort(ready.begin(), ready.end(), [](const Instance* a, const Instance* b) {
        if (a->priority != b->priority) return a->priority < b->priority;
        return a->lastAccessTime < b->lastAccessTime;
    });

    size_t active = activeCountLocked();
    size_t wanted = active >= options_.maxActiveViewports ? active - options_.maxActiveViewports + 1 : 0;
    if (wanted == 0 && active * options_.bytesPerViewport >= options_.memoryThreshold) {
        wanted = 1;
    }
    size_t count = std::min({wanted, options_.maxDeactivationsPerAttempt, ready.size()});
    for (size_t i = 0; i < count; ++i) {
        logMessage(LogLevel::Info, "LazyActivationLayer: freeing '%s'", ready[i]->id.c_str());
        deactivateLocked(*ready[i], events, teardowns);
    }
}

void LazyActivationLayer::Impl::deactivateLocked(Instance& instance, EventList& events, TeardownList& teardowns) {
    clearInactivityTimerLocked(instance);
    teardownLocked(instance, teardowns);
    instance.state = ViewportState::Uninitialized;
    instance.preloaded = false;
    events.push_back(ActivationEvent{ActivationEventType::Deactivated, instance.id});
    logMessage(LogLevel::Debug, "LazyActivationLayer: deactivated '%s'", instance.id.c_str());
}

void LazyActivationLayer::Impl::teardownLocked(Instance& instance, TeardownList& teardowns) {
    Teardown teardown;
    teardown.viewportId = instance.id;
    teardown.slot = instance.slot;
    scheduleTeardownLocked(std::move(teardown), teardowns);
    instance.slot = ViewportHandle();
    instance.surface = nullptr;
}

void LazyActivationLayer::Impl::scheduleTeardownLocked(Teardown teardown, TeardownList& teardowns) {
    ++teardownsInFlight_[teardown.viewportId];
    teardowns.push_back(std::move(teardown));
}

void LazyActivationLayer::Impl::runTeardowns(const TeardownList& teardowns) {
    if (teardowns.empty()) {
        return;
    }
    for (const Teardown& teardown : teardowns) {
        if (teardown.dematerialize && materializer_) {
            try {
                materializer_->dematerialize(teardown.viewportId);
            } catch (const std::exception& e) {
                logMessage(LogLevel::Error, "LazyActivationLayer: dematerialize('%s') threw: %s",
                           teardown.viewportId.c_str(), e.what());
            }
        }
        if (pool_ && teardown.slot.valid && !pool_->release(teardown.slot.poolId)) {
            logMessage(LogLevel::Warn, "LazyActivationLayer: pool rejected release of slot %u for '%s'",
                       teardown.slot.poolId, teardown.viewportId.c_str());
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const Teardown& teardown : teardowns) {
            auto it = teardownsInFlight_.find(teardown.viewportId);
            if (it != teardownsInFlight_.end() && --it->second == 0) {
                teardownsInFlight_.erase(it);
            }
        }
    }
    stateCv_.notify_all();
}

void LazyActivationLayer::Impl::touchLocked(Instance& instance, bool recordHistory) {
    instance.lastAccessTime = Clock::now();
    ++instance.accessCount;
    instance.preloaded = false;
    if (recordHistory) {
        accessHistory_.push_back(instance.id);
        if (accessHistory_.size() > kMaxAccessHistory) {
            accessHistory_.erase(accessHistory_.begin(),
                                 accessHistory_.end() - static_cast<std::ptrdiff_t>(kTrimmedAccessHistory));
        }
    }
    if (instance.state == ViewportState::Ready) {
        armInactivityTimerLocked(instance);
    }
}

void LazyActivationLayer::Impl::armInactivityTimerLocked(Instance& instance) {
    clearInactivityTimerLocked(instance);
    if (options_.inactivityTimeout.count() <= 0) {
        return;
    }
    const std::string id = instance.id;
    const uint64_t generation = instance.timerGeneration;
    instance.inactivityTimer = timers_.schedule(options_.inactivityTimeout, [this, id, generation] {
        handleInactive(id, generation);
    });
}

void LazyActivationLayer::Impl::clearInactivityTimerLocked(Instance& instance) {
    timers_.cancel(instance.inactivityTimer);
    instance.inactivityTimer = internal::TimerQueue::kInvalidTimer;
    ++instance.timerGeneration;
}

void LazyActivationLayer::Impl::handleInactive(const std::string& viewportId, uint64_t generation) {
    EventList events;
    TeardownList teardowns;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        Instance* instance = findLocked(viewportId);
        if (!instance || instance->state != ViewportState::Ready || instance->timerGeneration != generation) {
            return;
        }
        logMessage(LogLevel::Info, "LazyActivationLayer: '%s' inactive, deactivating", viewportId.c_str());
        deactivateLocked(*instance, events, teardowns);
    }
    runTeardowns(teardowns);
    emitAll(events);
}

void LazyActivationLayer::Impl::analyzePredictivePatterns() {
    if (!predictiveEnabled_.load()) {
        return;
    }
    for (const auto& prediction : predictNextViewports()) {
        if (prediction.probability > options_.predictionThreshold) {
            logMessage(LogLevel::Debug, "LazyActivationLayer: predicted '%s' p=%.2f", prediction.viewportId.c_str(),
                       prediction.probability);
            schedulePreload(prediction.viewportId, prediction.suggestedPreloadDelay);
        }
    }
}

void LazyActivationLayer::Impl::checkMemory() {
    EventList events;
    TeardownList teardowns;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        size_t ready = 0;
        for (const auto& entry : instances_) {
            if (entry.second.state == ViewportState::Ready) {
                ++ready;
            }
        }
        size_t used = ready * options_.bytesPerViewport;
        if (used <= options_.memoryThreshold) {
            return;
        }
        logMessage(LogLevel::Warn, "LazyActivationLayer: memory threshold exceeded (used=%zu threshold=%zu)", used,
                   options_.memoryThreshold);
        freeUpResourcesLocked(events, teardowns);
    }
    runTeardowns(teardowns);
    emitAll(events);
}

void LazyActivationLayer::Impl::schedulePreload(const std::string& viewportId, std::chrono::milliseconds delay) {
    timers_.schedule(delay, [this, viewportId] {
        // Materialization may block; keep it off the timer thread
        bool queued = workers_.submit([this, viewportId] { preloadViewport(viewportId); });
        if (!queued) {
            logMessage(LogLevel::Debug, "LazyActivationLayer: preload of '%s' dropped, shutting down",
                       viewportId.c_str());
        }
    });
}

void LazyActivationLayer::Impl::scheduleAdjacentPreloads(const std::string& viewportId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        return;
    }
    for (const std::string& neighbor : internal::adjacentIds(viewportId)) {
        const Instance* instance = findLocked(neighbor);
        if (instance && instance->state == ViewportState::Uninitialized) {
            schedulePreload(neighbor, options_.preloadDelay);
        }
    }
}

void LazyActivationLayer::Impl::emitAll(const EventList& events) {
    for (const auto& event : events) {
        events_.emit(event);
    }
}

} // namespace vp_stream
