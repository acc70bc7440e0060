// SPDX-License-Identifier: MIT
// Unit tests for ProgressiveScheduler

#include "TestUtils.h"
#include <ViewportStreaming/LazyActivationLayer.h>
#include <ViewportStreaming/ProgressiveScheduler.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace vp_stream {
namespace test {

using namespace std::chrono_literals;

namespace {

// Fixed-size chunks, ticks driven by the test
SchedulerOptions manualOptions(size_t chunkSize = 10, size_t maxConcurrent = 3) {
    SchedulerOptions options;
    options.chunkSize = chunkSize;
    options.maxConcurrentChunks = maxConcurrent;
    options.adaptiveChunkSize = false;
    options.autoStart = false;
    options.tickInterval = 5ms;
    return options;
}

SchedulerOptions tickingOptions(size_t chunkSize = 10, size_t maxConcurrent = 3) {
    SchedulerOptions options = manualOptions(chunkSize, maxConcurrent);
    options.autoStart = true;
    return options;
}

// Dispatch until nothing is queued or running
void drain(ProgressiveScheduler& scheduler) {
    ASSERT_TRUE(waitUntil([&] {
        scheduler.processQueue();
        auto stats = scheduler.getStatistics();
        return stats.queuedChunks == 0 && stats.activeChunks == 0;
    }, 5000ms));
}

class SchedulerEventRecorder {
public:
    explicit SchedulerEventRecorder(ProgressiveScheduler& scheduler) {
        scheduler.subscribe([this](const SchedulerEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        });
    }

    int count(SchedulerEventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count_if(events_.begin(), events_.end(),
                                              [type](const SchedulerEvent& e) { return e.type == type; }));
    }

    std::vector<SchedulerEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<SchedulerEvent> events_;
};

// Ignores the cancellation token. Items named "held-*" block until release(),
// the rest take a fixed delay.
class UncooperativeItemSource : public ItemSource {
public:
    explicit UncooperativeItemSource(std::chrono::milliseconds delay) : delay_(delay) {}

    ItemFetchResult fetch(const std::string& itemId, const CancellationToken&) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            started_.push_back(itemId);
        }
        if (itemId.compare(0, 5, "held-") == 0) {
            std::unique_lock<std::mutex> lock(mutex_);
            releasedCv_.wait(lock, [this] { return released_; });
        } else {
            std::this_thread::sleep_for(delay_);
        }
        ItemFetchResult result;
        result.ok = true;
        result.sizeBytes = 100;
        return result;
    }

    size_t estimateSize(const std::string&) const override { return 100; }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        releasedCv_.notify_all();
    }

    bool started(const std::string& itemId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::find(started_.begin(), started_.end(), itemId) != started_.end();
    }

private:
    std::chrono::milliseconds delay_;
    mutable std::mutex mutex_;
    std::condition_variable releasedCv_;
    bool released_ = false;
    std::vector<std::string> started_;
};

// Unblocks held fetches before the scheduler joins its workers
struct ReleaseOnExit {
    UncooperativeItemSource& source;
    ~ReleaseOnExit() { source.release(); }
};

} // namespace

// ============================================================================
// Sessions
// ============================================================================

TEST(ProgressiveSchedulerTest, TwentyFiveItemSequentialSession) {
    auto source = std::make_shared<MockItemSource>();
    ProgressiveScheduler scheduler(tickingOptions(10), source);

    ASSERT_EQ(scheduler.createLoadingSession("s1", makeItemIds(25), SessionMetadata(), LoadingStrategy::Sequential),
              "s1");
    auto chunks = scheduler.getSessionChunks("s1");
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].totalImages, 10u);
    EXPECT_EQ(chunks[1].totalImages, 10u);
    EXPECT_EQ(chunks[2].totalImages, 5u);
    EXPECT_EQ(chunks[0].priority, LoadPriority::Critical);
    EXPECT_EQ(chunks[1].priority, LoadPriority::High);
    EXPECT_EQ(chunks[2].priority, LoadPriority::Normal);
    EXPECT_EQ(chunks[2].chunkId, "s1-chunk-2");
    EXPECT_EQ(chunks[0].totalBytes, 10000u);

    auto before = scheduler.getSessionProgress("s1");
    EXPECT_EQ(before.status, SessionStatus::Pending);
    EXPECT_EQ(before.pendingChunks, 3u);
    EXPECT_EQ(before.percentage, 0);

    Ticket ticket = scheduler.queueSession("s1", LoadPriority::High);
    ASSERT_TRUE(ticket.valid());
    EXPECT_EQ(ticket.numTasksTotal(), 3);
    ASSERT_TRUE(ticket.waitFor(5000ms));

    auto progress = scheduler.getSessionProgress("s1");
    EXPECT_EQ(progress.completedChunks, 3u);
    EXPECT_EQ(progress.loadedImages, 25u);
    EXPECT_EQ(progress.loadedBytes, 25000u);
    EXPECT_EQ(progress.percentage, 100);
    EXPECT_EQ(progress.status, SessionStatus::Completed);
    EXPECT_EQ(scheduler.getChunkResults("s1-chunk-2").size(), 5u);
    EXPECT_EQ(source->fetchCount(), 25u);
}

TEST(ProgressiveSchedulerTest, ChunksPartitionEveryItem) {
    ProgressiveScheduler scheduler(manualOptions(7));
    ASSERT_FALSE(scheduler.createLoadingSession("s", makeItemIds(50), SessionMetadata(), LoadingStrategy::PriorityBased)
                     .empty());
    size_t total = 0;
    for (const auto& chunk : scheduler.getSessionChunks("s")) {
        EXPECT_GE(chunk.totalImages, 1u);
        EXPECT_LE(chunk.totalImages, 7u);
        total += chunk.totalImages;
    }
    EXPECT_EQ(total, 50u);
}

TEST(ProgressiveSchedulerTest, CreateRejectsEmptyAndDuplicateIds) {
    ProgressiveScheduler scheduler(manualOptions());
    EXPECT_TRUE(scheduler.createLoadingSession("", makeItemIds(3)).empty());
    EXPECT_EQ(scheduler.getLastError(), LoadingError::InvalidParameter);

    EXPECT_EQ(scheduler.createLoadingSession("s", makeItemIds(3)), "s");
    EXPECT_TRUE(scheduler.createLoadingSession("s", makeItemIds(3)).empty());
    EXPECT_EQ(scheduler.getLastError(), LoadingError::AlreadyExists);
}

TEST(ProgressiveSchedulerTest, EmptySessionCompletesWhenQueued) {
    ProgressiveScheduler scheduler(manualOptions());
    SchedulerEventRecorder recorder(scheduler);
    ASSERT_EQ(scheduler.createLoadingSession("empty", {}), "empty");

    Ticket ticket = scheduler.queueSession("empty");
    ASSERT_TRUE(ticket.valid());
    EXPECT_TRUE(ticket.waitFor(0ms));

    auto progress = scheduler.getSessionProgress("empty");
    EXPECT_EQ(progress.totalChunks, 0u);
    EXPECT_EQ(progress.percentage, 0);
    EXPECT_EQ(progress.status, SessionStatus::Completed);
    EXPECT_EQ(recorder.count(SchedulerEventType::SessionCompleted), 1);
}

TEST(ProgressiveSchedulerTest, QueueRejectsUnknownSessionAndBadPriority) {
    ProgressiveScheduler scheduler(manualOptions());
    EXPECT_FALSE(scheduler.queueSession("ghost").valid());
    EXPECT_EQ(scheduler.getLastError(), LoadingError::NotFound);
    EXPECT_FALSE(scheduler.getSessionTicket("ghost").valid());

    scheduler.createLoadingSession("s", makeItemIds(3));
    EXPECT_FALSE(scheduler.queueSession("s", static_cast<LoadPriority>(9)).valid());
    EXPECT_EQ(scheduler.getLastError(), LoadingError::InvalidParameter);
    EXPECT_FALSE(scheduler.getSessionTicket("s").valid());
}

TEST(ProgressiveSchedulerTest, RequeueMovesPendingChunks) {
    ProgressiveScheduler scheduler(manualOptions(10));
    scheduler.createLoadingSession("s", makeItemIds(30));

    Ticket first = scheduler.queueSession("s", LoadPriority::Low);
    EXPECT_EQ(scheduler.getStatistics().queuedByPriority[3], 3u);

    Ticket second = scheduler.queueSession("s", LoadPriority::Critical);
    auto stats = scheduler.getStatistics();
    EXPECT_EQ(stats.queuedByPriority[0], 3u);
    EXPECT_EQ(stats.queuedByPriority[3], 0u);
    EXPECT_EQ(stats.queuedChunks, 3u);
    EXPECT_EQ(first.numTasksTotal(), second.numTasksTotal());
}

// ============================================================================
// Dispatch
// ============================================================================

TEST(ProgressiveSchedulerTest, HigherPriorityDispatchesFirst) {
    auto source = std::make_shared<MockItemSource>();
    ProgressiveScheduler scheduler(manualOptions(10, 1), source);

    scheduler.createLoadingSession("low", makeItemIds(10, "low-"));
    scheduler.createLoadingSession("high", makeItemIds(10, "high-"));
    scheduler.queueSession("low", LoadPriority::Low);
    scheduler.queueSession("high", LoadPriority::Critical);

    drain(scheduler);
    auto fetched = source->fetched();
    ASSERT_EQ(fetched.size(), 20u);
    EXPECT_EQ(fetched.front(), "high-0");
    EXPECT_EQ(fetched[9], "high-9");
    EXPECT_EQ(fetched[10], "low-0");
}

TEST(ProgressiveSchedulerTest, EqualPriorityKeepsCreationOrder) {
    auto source = std::make_shared<MockItemSource>();
    ProgressiveScheduler scheduler(manualOptions(10, 1), source);

    scheduler.createLoadingSession("a", makeItemIds(10, "a-"));
    scheduler.createLoadingSession("b", makeItemIds(10, "b-"));
    scheduler.queueSession("b");
    scheduler.queueSession("a");

    drain(scheduler);
    auto fetched = source->fetched();
    ASSERT_EQ(fetched.size(), 20u);
    EXPECT_EQ(fetched.front(), "a-0");
    EXPECT_EQ(fetched.back(), "b-9");
}

TEST(ProgressiveSchedulerTest, ProcessQueueRespectsConcurrencyLimit) {
    auto source = std::make_shared<MockItemSource>();
    source->setGated(true);
    ProgressiveScheduler scheduler(manualOptions(5, 2), source);
    scheduler.createLoadingSession("s", makeItemIds(20));
    scheduler.queueSession("s");

    EXPECT_EQ(scheduler.processQueue(), 2u);
    EXPECT_EQ(scheduler.processQueue(), 0u);
    auto stats = scheduler.getStatistics();
    EXPECT_EQ(stats.activeChunks, 2u);
    EXPECT_EQ(stats.queuedChunks, 2u);
    EXPECT_EQ(scheduler.getSessionProgress("s").loadingChunks, 2u);

    scheduler.cancelSession("s");
    EXPECT_TRUE(waitUntil([&] { return scheduler.getActiveChunkCount() == 0; }));
}

TEST(ProgressiveSchedulerTest, ConcurrentChunksNeverExceedLimit) {
    auto source = std::make_shared<MockItemSource>(1000, 2ms);
    auto options = tickingOptions(5, 2);
    options.tickInterval = 1ms;
    ProgressiveScheduler scheduler(options, source);

    std::atomic<bool> done{false};
    std::atomic<size_t> peakActive{0};
    std::thread sampler([&] {
        while (!done.load()) {
            size_t active = scheduler.getActiveChunkCount();
            if (active > peakActive.load()) peakActive.store(active);
            std::this_thread::sleep_for(1ms);
        }
    });

    scheduler.createLoadingSession("s", makeItemIds(60));
    Ticket ticket = scheduler.queueSession("s");
    EXPECT_TRUE(ticket.waitFor(10000ms));
    done.store(true);
    sampler.join();

    EXPECT_LE(source->peakInFlight(), 2);
    EXPECT_LE(peakActive.load(), 2u);
    EXPECT_EQ(scheduler.getSessionProgress("s").loadedImages, 60u);
}

TEST(ProgressiveSchedulerTest, ProcessQueueIsNotReentrant) {
    auto source = std::make_shared<MockItemSource>();
    ProgressiveScheduler scheduler(manualOptions(), source);

    std::atomic<int> nestedCalls{0};
    std::atomic<size_t> nestedDispatched{99};
    scheduler.subscribe([&](const SchedulerEvent& event) {
        if (event.type == SchedulerEventType::ChunkStarted && nestedCalls.fetch_add(1) == 0) {
            nestedDispatched.store(scheduler.processQueue());
        }
    });

    scheduler.createLoadingSession("s", makeItemIds(10));
    scheduler.queueSession("s");
    EXPECT_EQ(scheduler.processQueue(), 1u);
    EXPECT_EQ(nestedCalls.load(), 1);
    EXPECT_EQ(nestedDispatched.load(), 0u);
    drain(scheduler);
}

TEST(ProgressiveSchedulerTest, SetMaxConcurrentChunksIsClamped) {
    auto options = manualOptions(10, 3);
    options.workerThreads = 2;
    ProgressiveScheduler scheduler(options);
    EXPECT_EQ(scheduler.getMaxConcurrentChunks(), 2u);

    scheduler.setMaxConcurrentChunks(10);
    EXPECT_EQ(scheduler.getMaxConcurrentChunks(), 2u);
    scheduler.setMaxConcurrentChunks(0);
    EXPECT_EQ(scheduler.getMaxConcurrentChunks(), 1u);
}

TEST(ProgressiveSchedulerTest, StartAndStop) {
    ProgressiveScheduler scheduler(manualOptions());
    EXPECT_FALSE(scheduler.isRunning());
    scheduler.start();
    EXPECT_TRUE(scheduler.isRunning());
    scheduler.stop();
    EXPECT_FALSE(scheduler.isRunning());
}

// ============================================================================
// Failures
// ============================================================================

TEST(ProgressiveSchedulerTest, ItemFailuresDoNotAbortChunk) {
    auto source = std::make_shared<MockItemSource>();
    source->failItem("item-3");
    source->throwOnItem("item-5");
    ProgressiveScheduler scheduler(tickingOptions(10), source);

    scheduler.createLoadingSession("s", makeItemIds(10));
    ASSERT_TRUE(scheduler.queueSession("s").waitFor(5000ms));

    auto chunk = scheduler.getChunkProgress("s-chunk-0");
    EXPECT_EQ(chunk.status, ChunkStatus::Completed);
    EXPECT_EQ(chunk.loadedImages, 8u);
    EXPECT_EQ(chunk.failedImages, 2u);

    auto results = scheduler.getChunkResults("s-chunk-0");
    ASSERT_EQ(results.size(), 10u);
    EXPECT_FALSE(results[3].loaded);
    EXPECT_EQ(results[3].error, "missing item-3");
    EXPECT_FALSE(results[5].loaded);
    EXPECT_NE(results[5].error.find("exploded"), std::string::npos);
    EXPECT_TRUE(results[9].loaded);

    EXPECT_EQ(scheduler.getStatistics().failedItems, 2u);
    EXPECT_EQ(scheduler.getSessionProgress("s").status, SessionStatus::Completed);
}

TEST(ProgressiveSchedulerTest, ChunkTimeoutBecomesError) {
    auto source = std::make_shared<MockItemSource>(1000, 20ms);
    auto options = tickingOptions(10);
    options.chunkTimeout = 30ms;

    std::atomic<int> errors{0};
    std::atomic<int> sessionCompletions{0};
    LoadDatasetOptions dataset;
    dataset.sessionId = "slow";
    dataset.chunkCallbacks.onError = [&errors](const ChunkProgress& progress) {
        if (progress.error.find("timed out") != std::string::npos) ++errors;
    };
    dataset.onComplete = [&sessionCompletions](const std::string&, const SessionResults& results) {
        if (results.empty()) ++sessionCompletions;
    };

    ProgressiveScheduler scheduler(options, source);
    SchedulerEventRecorder recorder(scheduler);
    ASSERT_EQ(scheduler.loadDataset(makeItemIds(10), dataset), "slow");
    ASSERT_TRUE(scheduler.getSessionTicket("slow").waitFor(5000ms));
    ASSERT_TRUE(waitUntil([&] { return sessionCompletions.load() == 1; }));

    auto chunk = scheduler.getChunkProgress("slow-chunk-0");
    EXPECT_EQ(chunk.status, ChunkStatus::Error);
    EXPECT_EQ(chunk.error, "timed out after 30 ms");
    EXPECT_LT(chunk.loadedImages, 10u);
    EXPECT_EQ(errors.load(), 1);
    EXPECT_EQ(scheduler.getSessionProgress("slow").status, SessionStatus::Error);
    EXPECT_EQ(scheduler.getStatistics().failedChunks, 1u);
    EXPECT_EQ(recorder.count(SchedulerEventType::ChunkError), 1);
    EXPECT_EQ(recorder.count(SchedulerEventType::SessionCompleted), 1);
}

TEST(ProgressiveSchedulerTest, ThrowingCallbackIsContained) {
    LogCapture capture(LogLevel::Warn);
    ProgressiveScheduler scheduler(tickingOptions(10));

    LoadDatasetOptions dataset;
    dataset.onProgress = [](const SessionProgress&) { throw std::runtime_error("ui gone"); };
    std::string id = scheduler.loadDataset(makeItemIds(10), dataset);
    ASSERT_FALSE(id.empty());
    ASSERT_TRUE(scheduler.getSessionTicket(id).waitFor(5000ms));
    EXPECT_TRUE(capture.contains("callback threw: ui gone"));
    EXPECT_EQ(scheduler.getSessionProgress(id).loadedImages, 10u);
}

// ============================================================================
// Cancellation and release
// ============================================================================

TEST(ProgressiveSchedulerTest, CancelSessionSettlesEveryChunk) {
    auto source = std::make_shared<MockItemSource>();
    source->setGated(true);
    ProgressiveScheduler scheduler(manualOptions(5, 2), source);
    SchedulerEventRecorder recorder(scheduler);
    scheduler.createLoadingSession("s", makeItemIds(20));
    Ticket ticket = scheduler.queueSession("s");
    ASSERT_EQ(scheduler.processQueue(), 2u);

    EXPECT_TRUE(scheduler.cancelSession("s"));
    auto progress = scheduler.getSessionProgress("s");
    EXPECT_EQ(progress.pendingChunks, 0u);
    EXPECT_EQ(progress.loadingChunks, 0u);
    EXPECT_EQ(progress.cancelledChunks, 4u);
    EXPECT_EQ(progress.status, SessionStatus::Cancelled);
    EXPECT_TRUE(ticket.waitFor(1000ms));
    EXPECT_TRUE(waitUntil([&] { return scheduler.getActiveChunkCount() == 0; }));

    EXPECT_TRUE(scheduler.cancelSession("s"));
    EXPECT_EQ(recorder.count(SchedulerEventType::SessionCancelled), 1);
    EXPECT_EQ(recorder.count(SchedulerEventType::SessionCompleted), 0);

    EXPECT_FALSE(scheduler.queueSession("s").valid());
    EXPECT_EQ(scheduler.getLastError(), LoadingError::InvalidState);
    EXPECT_EQ(scheduler.getStatistics().queuedChunks, 0u);

    EXPECT_FALSE(scheduler.cancelSession("ghost"));
}

TEST(ProgressiveSchedulerTest, ReleaseSessionForgetsEverything) {
    ProgressiveScheduler scheduler(tickingOptions(10));
    scheduler.createLoadingSession("s", makeItemIds(20));
    ASSERT_TRUE(scheduler.queueSession("s").waitFor(5000ms));
    ASSERT_EQ(scheduler.getStatistics().retainedResults, 2u);

    EXPECT_TRUE(scheduler.releaseSession("s"));
    EXPECT_FALSE(scheduler.getSessionProgress("s").valid);
    EXPECT_FALSE(scheduler.getChunkProgress("s-chunk-0").valid);
    EXPECT_TRUE(scheduler.getChunkResults("s-chunk-0").empty());
    auto stats = scheduler.getStatistics();
    EXPECT_EQ(stats.sessions, 0u);
    EXPECT_EQ(stats.retainedResults, 0u);

    EXPECT_FALSE(scheduler.releaseSession("s"));
    EXPECT_EQ(scheduler.getLastError(), LoadingError::NotFound);

    // The id can be reused once released
    EXPECT_EQ(scheduler.createLoadingSession("s", makeItemIds(5)), "s");
}

TEST(ProgressiveSchedulerTest, ReleaseRunningSessionReleasesTicket) {
    auto source = std::make_shared<MockItemSource>();
    source->setGated(true);
    ProgressiveScheduler scheduler(manualOptions(5, 2), source);
    scheduler.createLoadingSession("s", makeItemIds(20));
    Ticket ticket = scheduler.queueSession("s");
    ASSERT_EQ(scheduler.processQueue(), 2u);

    EXPECT_TRUE(scheduler.releaseSession("s"));
    EXPECT_TRUE(ticket.waitFor(0ms));
    EXPECT_TRUE(waitUntil([&] { return scheduler.getActiveChunkCount() == 0; }));
}

TEST(ProgressiveSchedulerTest, StaleRunnerLeavesRecreatedSessionAlone) {
    auto source = std::make_shared<UncooperativeItemSource>(150ms);
    ProgressiveScheduler scheduler(manualOptions(2, 2), source);
    ReleaseOnExit unblock{*source};

    scheduler.createLoadingSession("s", {"quick-0", "quick-1"});
    scheduler.queueSession("s");
    ASSERT_EQ(scheduler.processQueue(), 1u);
    ASSERT_TRUE(waitUntil([&] { return source->started("quick-0"); }));
    ASSERT_TRUE(scheduler.releaseSession("s"));

    // Same id, same chunk ids, while the old runner is still inside fetch
    ASSERT_EQ(scheduler.createLoadingSession("s", {"held-0", "held-1"}), "s");
    Ticket ticket = scheduler.queueSession("s");
    ASSERT_TRUE(ticket.valid());
    ASSERT_EQ(scheduler.processQueue(), 1u);
    ASSERT_TRUE(waitUntil([&] { return source->started("held-0"); }));

    // The old runner returns from its fetch and gives back its slot
    ASSERT_TRUE(waitUntil([&] { return scheduler.getActiveChunkCount() == 1; }));
    EXPECT_FALSE(source->started("quick-1"));

    auto chunk = scheduler.getChunkProgress("s-chunk-0");
    EXPECT_EQ(chunk.status, ChunkStatus::Loading);
    EXPECT_EQ(chunk.loadedImages, 0u);
    EXPECT_EQ(ticket.numTasksRemaining(), 1);
    EXPECT_EQ(scheduler.getStatistics().completedChunks, 0u);

    source->release();
    ASSERT_TRUE(ticket.waitFor(5000ms));
    chunk = scheduler.getChunkProgress("s-chunk-0");
    EXPECT_EQ(chunk.status, ChunkStatus::Completed);
    EXPECT_EQ(chunk.loadedImages, 2u);
    EXPECT_EQ(scheduler.getSessionProgress("s").status, SessionStatus::Completed);
}

TEST(ProgressiveSchedulerTest, CancelPendingChunk) {
    auto source = std::make_shared<MockItemSource>();
    source->setGated(true);
    ProgressiveScheduler scheduler(manualOptions(5, 1), source);
    SchedulerEventRecorder recorder(scheduler);
    scheduler.createLoadingSession("s", makeItemIds(10));
    Ticket ticket = scheduler.queueSession("s");
    ASSERT_EQ(scheduler.processQueue(), 1u);

    EXPECT_TRUE(scheduler.cancelChunk("s-chunk-1"));
    EXPECT_EQ(scheduler.getChunkProgress("s-chunk-1").status, ChunkStatus::Cancelled);
    EXPECT_EQ(scheduler.getStatistics().queuedChunks, 0u);
    EXPECT_EQ(ticket.numTasksRemaining(), 1);

    EXPECT_FALSE(scheduler.cancelChunk("s-chunk-1"));
    EXPECT_EQ(scheduler.getLastError(), LoadingError::InvalidState);
    EXPECT_FALSE(scheduler.cancelChunk("ghost-chunk-0"));
    EXPECT_EQ(scheduler.getLastError(), LoadingError::NotFound);

    source->setGated(false);
    ASSERT_TRUE(ticket.waitFor(5000ms));
    auto progress = scheduler.getSessionProgress("s");
    EXPECT_EQ(progress.completedChunks, 1u);
    EXPECT_EQ(progress.cancelledChunks, 1u);
    EXPECT_EQ(progress.loadedImages, 5u);
    EXPECT_EQ(progress.status, SessionStatus::Cancelled);
    EXPECT_TRUE(waitUntil([&] { return recorder.count(SchedulerEventType::SessionCompleted) == 1; }));
    EXPECT_EQ(recorder.count(SchedulerEventType::SessionCancelled), 0);
    EXPECT_EQ(source->fetchCount(), 5u);
}

TEST(ProgressiveSchedulerTest, CancelLoadingChunk) {
    auto source = std::make_shared<MockItemSource>();
    source->setGated(true);
    ProgressiveScheduler scheduler(manualOptions(5, 2), source);
    scheduler.createLoadingSession("s", makeItemIds(10));
    Ticket ticket = scheduler.queueSession("s");
    ASSERT_EQ(scheduler.processQueue(), 2u);

    EXPECT_TRUE(scheduler.cancelChunk("s-chunk-0"));
    EXPECT_EQ(scheduler.getChunkProgress("s-chunk-0").status, ChunkStatus::Cancelled);
    EXPECT_EQ(ticket.numTasksRemaining(), 1);
    EXPECT_TRUE(waitUntil([&] { return scheduler.getActiveChunkCount() == 1; }));

    source->setGated(false);
    ASSERT_TRUE(ticket.waitFor(5000ms));
    EXPECT_EQ(scheduler.getChunkProgress("s-chunk-0").status, ChunkStatus::Cancelled);
    EXPECT_TRUE(scheduler.getChunkResults("s-chunk-0").empty());
    EXPECT_EQ(scheduler.getChunkProgress("s-chunk-1").status, ChunkStatus::Completed);
    auto stats = scheduler.getStatistics();
    EXPECT_EQ(stats.cancelledChunks, 1u);
    EXPECT_EQ(stats.completedChunks, 1u);
}

TEST(ProgressiveSchedulerTest, ChunkCancelledBeforeQueueCountsTowardTicket) {
    ProgressiveScheduler scheduler(manualOptions(5, 2));
    scheduler.createLoadingSession("s", makeItemIds(10));
    ASSERT_TRUE(scheduler.cancelChunk("s-chunk-1"));

    Ticket ticket = scheduler.queueSession("s");
    ASSERT_TRUE(ticket.valid());
    EXPECT_EQ(ticket.numTasksTotal(), 2);
    EXPECT_EQ(ticket.numTasksRemaining(), 1);
    EXPECT_EQ(scheduler.getStatistics().queuedChunks, 1u);

    drain(scheduler);
    EXPECT_TRUE(ticket.waitFor(0ms));
}

// ============================================================================
// Memory pressure
// ============================================================================

TEST(ProgressiveSchedulerTest, PressureEvictsOldestRetainedResults) {
    auto pressure = std::make_shared<FixedPressureSource>(0.5);
    ProgressiveScheduler scheduler(manualOptions(10, 1), nullptr, pressure);
    SchedulerEventRecorder recorder(scheduler);
    scheduler.createLoadingSession("s", makeItemIds(40));
    scheduler.queueSession("s");
    drain(scheduler);
    ASSERT_EQ(scheduler.getStatistics().retainedResults, 4u);

    pressure->set(0.85);
    scheduler.processQueue();
    auto stats = scheduler.getStatistics();
    EXPECT_EQ(stats.retainedResults, 3u);
    EXPECT_EQ(stats.evictedChunks, 1u);
    EXPECT_TRUE(scheduler.getChunkResults("s-chunk-0").empty());
    EXPECT_FALSE(scheduler.getChunkResults("s-chunk-1").empty());

    auto events = recorder.events();
    auto evicted = std::find_if(events.begin(), events.end(),
                                [](const SchedulerEvent& e) { return e.type == SchedulerEventType::ChunkEvicted; });
    ASSERT_NE(evicted, events.end());
    EXPECT_EQ(evicted->chunkId, "s-chunk-0");
    EXPECT_EQ(evicted->sessionId, "s");

    // Eviction drops results only; progress is kept
    EXPECT_EQ(scheduler.getChunkProgress("s-chunk-0").status, ChunkStatus::Completed);
    EXPECT_EQ(scheduler.getSessionProgress("s").loadedImages, 40u);
}

TEST(ProgressiveSchedulerTest, FailingPressureSourceDoesNotStopLoading) {
    class OfflineSensor : public PressureSource {
    public:
        double reading() const override { throw std::runtime_error("sensor offline"); }
    };
    ProgressiveScheduler scheduler(manualOptions(5, 2), nullptr, std::make_shared<OfflineSensor>());
    ASSERT_EQ(scheduler.createLoadingSession("s", makeItemIds(10)), "s");
    Ticket ticket = scheduler.queueSession("s");
    drain(scheduler);
    EXPECT_TRUE(ticket.waitFor(1000ms));
    EXPECT_EQ(scheduler.getSessionProgress("s").status, SessionStatus::Completed);
}

TEST(ProgressiveSchedulerTest, SeverePressureDefersDispatch) {
    auto pressure = std::make_shared<FixedPressureSource>(0.97);
    ProgressiveScheduler scheduler(manualOptions(), nullptr, pressure);
    scheduler.createLoadingSession("s", makeItemIds(10));
    scheduler.queueSession("s");

    EXPECT_EQ(scheduler.processQueue(), 0u);
    EXPECT_EQ(scheduler.getChunkProgress("s-chunk-0").status, ChunkStatus::Pending);

    pressure->set(0.5);
    EXPECT_EQ(scheduler.processQueue(), 1u);
    drain(scheduler);
    EXPECT_EQ(scheduler.getChunkProgress("s-chunk-0").status, ChunkStatus::Completed);
}

// ============================================================================
// loadDataset
// ============================================================================

TEST(ProgressiveSchedulerTest, LoadDatasetRunsCallbacks) {
    ProgressiveScheduler scheduler(tickingOptions(10));

    std::atomic<int> chunkCompletions{0};
    std::atomic<int> progressCalls{0};
    std::atomic<int> lastPercentage{0};
    std::atomic<size_t> completedChunks{0};
    std::atomic<int> sessionCompletions{0};

    LoadDatasetOptions dataset;
    dataset.strategy = LoadingStrategy::Sequential;
    dataset.priority = LoadPriority::High;
    dataset.chunkCallbacks.onComplete = [&](const ChunkProgress&, const std::vector<ItemResult>& results) {
        if (results.size() == 10) ++chunkCompletions;
    };
    dataset.onProgress = [&](const SessionProgress& progress) {
        ++progressCalls;
        lastPercentage.store(progress.percentage);
    };
    dataset.onComplete = [&](const std::string&, const SessionResults& results) {
        completedChunks.store(results.size());
        ++sessionCompletions;
    };

    std::string id = scheduler.loadDataset(makeItemIds(30), dataset);
    ASSERT_EQ(id.rfind("session-", 0), 0u);
    ASSERT_TRUE(waitUntil([&] { return sessionCompletions.load() == 1; }, 5000ms));

    EXPECT_EQ(chunkCompletions.load(), 3);
    EXPECT_EQ(completedChunks.load(), 3u);
    EXPECT_GE(progressCalls.load(), 30);
    EXPECT_EQ(scheduler.getSessionProgress(id).percentage, 100);

    std::string another = scheduler.loadDataset(makeItemIds(3));
    EXPECT_FALSE(another.empty());
    EXPECT_NE(another, id);
    EXPECT_TRUE(scheduler.getSessionTicket(another).waitFor(5000ms));
    EXPECT_EQ(sessionCompletions.load(), 1);
}

TEST(ProgressiveSchedulerTest, LoadDatasetRejectsDuplicateId) {
    ProgressiveScheduler scheduler(manualOptions());
    LoadDatasetOptions dataset;
    dataset.sessionId = "ct";
    EXPECT_EQ(scheduler.loadDataset(makeItemIds(3), dataset), "ct");
    EXPECT_TRUE(scheduler.loadDataset(makeItemIds(3), dataset).empty());
    EXPECT_EQ(scheduler.getLastError(), LoadingError::AlreadyExists);
}

// ============================================================================
// Viewport activation
// ============================================================================

TEST(ProgressiveSchedulerTest, TargetViewportIsActivated) {
    ActivationOptions activationOptions;
    activationOptions.preloadAdjacent = false;
    activationOptions.predictionInterval = 0ms;
    activationOptions.memoryCheckInterval = 0ms;
    auto materializer = std::make_shared<MockMaterializer>();
    auto layer = std::make_shared<LazyActivationLayer>(activationOptions, materializer);
    layer->registerViewport("viewport-0");

    ProgressiveScheduler scheduler(tickingOptions(5), nullptr, nullptr, layer);
    LoadDatasetOptions dataset;
    dataset.targetViewportId = "viewport-0";
    std::string id = scheduler.loadDataset(makeItemIds(20), dataset);
    ASSERT_TRUE(scheduler.getSessionTicket(id).waitFor(5000ms));

    EXPECT_EQ(layer->getViewportState("viewport-0").state, ViewportState::Ready);
    EXPECT_EQ(materializer->materializeCalls(), 1);
    EXPECT_EQ(layer->getViewportState("viewport-0").accessCount, 4u);
}

TEST(ProgressiveSchedulerTest, UnavailableViewportRequeuesChunk) {
    ActivationOptions activationOptions;
    activationOptions.preloadAdjacent = false;
    activationOptions.predictionInterval = 0ms;
    activationOptions.memoryCheckInterval = 0ms;
    auto materializer = std::make_shared<MockMaterializer>();
    materializer->setFailing(true);
    auto layer = std::make_shared<LazyActivationLayer>(activationOptions, materializer);
    layer->registerViewport("viewport-0");

    auto source = std::make_shared<MockItemSource>();
    ProgressiveScheduler scheduler(manualOptions(10), source, nullptr, layer);
    LoadDatasetOptions dataset;
    dataset.sessionId = "s";
    dataset.targetViewportId = "viewport-0";
    ASSERT_EQ(scheduler.loadDataset(makeItemIds(10), dataset), "s");

    ASSERT_EQ(scheduler.processQueue(), 1u);
    ASSERT_TRUE(waitUntil([&] { return scheduler.getActiveChunkCount() == 0; }));
    EXPECT_EQ(scheduler.getChunkProgress("s-chunk-0").status, ChunkStatus::Pending);
    EXPECT_EQ(scheduler.getStatistics().queuedChunks, 1u);
    EXPECT_EQ(source->fetchCount(), 0u);

    materializer->setFailing(false);
    drain(scheduler);
    EXPECT_EQ(scheduler.getChunkProgress("s-chunk-0").status, ChunkStatus::Completed);
    EXPECT_EQ(source->fetchCount(), 10u);
}

// ============================================================================
// Statistics, events, disposal
// ============================================================================

TEST(ProgressiveSchedulerTest, StatisticsTrackWork) {
    auto source = std::make_shared<MockItemSource>(4096);
    ProgressiveScheduler scheduler(tickingOptions(10), source);
    scheduler.createLoadingSession("s", makeItemIds(20));
    ASSERT_TRUE(scheduler.queueSession("s").waitFor(5000ms));

    auto stats = scheduler.getStatistics();
    EXPECT_EQ(stats.completedChunks, 2u);
    EXPECT_EQ(stats.loadedItems, 20u);
    EXPECT_EQ(stats.failedItems, 0u);
    EXPECT_EQ(stats.sessions, 1u);
    EXPECT_GT(stats.averageNetworkSpeed, 0.0);
}

TEST(ProgressiveSchedulerTest, EventsFollowChunkLifecycle) {
    ProgressiveScheduler scheduler(manualOptions(5, 1));
    SchedulerEventRecorder recorder(scheduler);
    scheduler.createLoadingSession("s", makeItemIds(5));
    scheduler.queueSession("s");
    drain(scheduler);
    ASSERT_TRUE(waitUntil([&] { return recorder.count(SchedulerEventType::SessionCompleted) == 1; }));

    auto events = recorder.events();
    ASSERT_GE(events.size(), 4u);
    EXPECT_EQ(events.front().type, SchedulerEventType::ChunkQueued);
    EXPECT_EQ(events[1].type, SchedulerEventType::ChunkStarted);
    EXPECT_EQ(recorder.count(SchedulerEventType::ChunkProgress), 5);
    EXPECT_EQ(recorder.count(SchedulerEventType::ChunkCompleted), 1);
    EXPECT_EQ(events.back().type, SchedulerEventType::SessionCompleted);
}

TEST(ProgressiveSchedulerTest, DisposeReleasesWaiters) {
    auto source = std::make_shared<MockItemSource>();
    source->setGated(true);
    ProgressiveScheduler scheduler(manualOptions(5, 2), source);
    scheduler.createLoadingSession("s", makeItemIds(20));
    Ticket ticket = scheduler.queueSession("s");
    ASSERT_EQ(scheduler.processQueue(), 2u);

    scheduler.dispose();
    EXPECT_TRUE(scheduler.isDisposed());
    EXPECT_TRUE(ticket.waitFor(0ms));
    EXPECT_EQ(scheduler.getActiveChunkCount(), 0u);

    EXPECT_TRUE(scheduler.createLoadingSession("t", makeItemIds(3)).empty());
    EXPECT_EQ(scheduler.getLastError(), LoadingError::Disposed);
    EXPECT_EQ(scheduler.processQueue(), 0u);
    scheduler.dispose();
}

}  // namespace test
}  // namespace vp_stream
