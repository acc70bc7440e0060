// SPDX-License-Identifier: MIT
#include "ItemSource/ItemSource.h"
#include "ViewportStreaming/LazyActivationLayer.h"
#include "ViewportStreaming/Logging.h"
#include "ViewportStreaming/ProgressiveScheduler.h"
#include "ViewportStreaming/ViewportPool.h"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

// Demo goal: stream two CT series into a 2x2 layout while viewports are activated on demand.

// Simulated network: each item takes a few milliseconds, roughly 1 in 40 fails.
class SimulatedSeriesSource : public vp_stream::ItemSource {
public:
    explicit SimulatedSeriesSource(unsigned int seed) : rng_(seed) {}

    vp_stream::ItemFetchResult fetch(const std::string& itemId, const vp_stream::CancellationToken& token) override {
        int delayMs = 0;
        bool fail = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            delayMs = std::uniform_int_distribution<int>(2, 8)(rng_);
            fail = std::uniform_int_distribution<int>(0, 39)(rng_) == 0;
        }
        for (int i = 0; i < delayMs; ++i) {
            if (token.isCancelled()) {
                return {false, 0, "cancelled"};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (fail) {
            return {false, 0, "simulated network error for " + itemId};
        }
        return {true, estimateSize(itemId), std::string()};
    }

    size_t estimateSize(const std::string&) const override { return 256 * 1024; }

private:
    std::mutex mutex_;
    std::mt19937 rng_;
};

// Rendering engine stand-in: counts materializations
class ConsoleMaterializer : public vp_stream::ViewportMaterializer {
public:
    bool materialize(const std::string& viewportId, vp_stream::SurfaceHandle, const vp_stream::ViewportHandle& slot) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        ++count_;
        std::cout << "  materialized " << viewportId << " on pool slot " << slot.poolId << "\n";
        return true;
    }

    void dematerialize(const std::string& viewportId) override {
        std::cout << "  dematerialized " << viewportId << "\n";
    }

    int count() const { return count_.load(); }

private:
    std::atomic<int> count_{0};
};

static std::vector<std::string> makeSeries(const std::string& seriesUid, int count) {
    std::vector<std::string> ids;
    ids.reserve(count);
    for (int i = 0; i < count; ++i) {
        ids.push_back("wadors:" + seriesUid + "/frames/" + std::to_string(i + 1));
    }
    return ids;
}

int main(int argc, char** argv) {
    if (argc > 1 && std::string(argv[1]) == "-v") {
        vp_stream::setLogLevel(vp_stream::LogLevel::Info);
    }

    vp_stream::ViewportPoolOptions poolOptions;
    poolOptions.minPoolSize = 2;
    poolOptions.maxPoolSize = 4;
    poolOptions.initialPoolSize = 2;
    poolOptions.cleanupDelay = std::chrono::milliseconds(50);
    auto pool = std::make_shared<vp_stream::ViewportPool>(poolOptions);

    vp_stream::ActivationOptions activationOptions;
    activationOptions.maxActiveViewports = 4;
    activationOptions.preloadDelay = std::chrono::milliseconds(20);
    activationOptions.inactivityTimeout = std::chrono::milliseconds(2000);
    auto materializer = std::make_shared<ConsoleMaterializer>();
    auto activation = std::make_shared<vp_stream::LazyActivationLayer>(activationOptions, materializer, pool);

    for (int i = 0; i < 4; ++i) {
        activation->registerViewport("viewport-" + std::to_string(i), {{"layout", "2x2"}});
    }

    vp_stream::SchedulerOptions schedulerOptions;
    schedulerOptions.maxConcurrentChunks = 3;
    schedulerOptions.tickInterval = std::chrono::milliseconds(20);
    auto source = std::make_shared<SimulatedSeriesSource>(42);
    vp_stream::ProgressiveScheduler scheduler(schedulerOptions, source, nullptr, activation);

    std::atomic<int> sessionsDone{0};
    auto makeOptions = [&](const std::string& sessionId, const std::string& viewportId,
                           vp_stream::LoadingStrategy strategy, vp_stream::LoadPriority priority) {
        vp_stream::LoadDatasetOptions options;
        options.sessionId = sessionId;
        options.strategy = strategy;
        options.priority = priority;
        options.metadata.modality = "CT";
        options.metadata.studyUid = "1.2.840.113619.2.55";
        options.metadata.seriesUid = sessionId;
        options.targetViewportId = viewportId;
        options.onComplete = [&sessionsDone](const std::string& id, const vp_stream::SessionResults& results) {
            std::cout << "session " << id << " finished with " << results.size() << " chunks\n";
            ++sessionsDone;
        };
        return options;
    };

    auto start = std::chrono::steady_clock::now();

    std::string axial = scheduler.loadDataset(
        makeSeries("axial", 120),
        makeOptions("axial", "viewport-0", vp_stream::LoadingStrategy::Sequential, vp_stream::LoadPriority::High));
    std::string sagittal = scheduler.loadDataset(
        makeSeries("sagittal", 80),
        makeOptions("sagittal", "viewport-1", vp_stream::LoadingStrategy::Adaptive, vp_stream::LoadPriority::Normal));

    if (axial.empty() || sagittal.empty()) {
        std::cerr << "Failed to queue sessions: " << vp_stream::getErrorString(scheduler.getLastError()) << "\n";
        return 1;
    }

    while (sessionsDone.load() < 2) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        for (const auto& id : {axial, sagittal}) {
            auto progress = scheduler.getSessionProgress(id);
            std::cout << std::setw(9) << id << ": " << std::setw(3) << progress.percentage << "% ("
                      << progress.completedChunks << "/" << progress.totalChunks << " chunks, "
                      << progress.failedImages << " failed) " << vp_stream::sessionStatusName(progress.status)
                      << "\n";
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    auto stats = scheduler.getStatistics();
    auto poolStats = pool->getStatistics();
    auto health = pool->getHealthStatus();

    std::cout << "\n=== Summary ===\n";
    std::cout << "Elapsed: " << elapsed.count() << " ms\n";
    std::cout << "Items loaded: " << stats.loadedItems << ", failed: " << stats.failedItems << "\n";
    std::cout << "Average speed: " << std::fixed << std::setprecision(1)
              << stats.averageNetworkSpeed / (1024.0 * 1024.0) << " MiB/s\n";
    std::cout << "Materializations: " << materializer->count() << "\n";
    std::cout << "Pool: " << poolStats.totalViewports << " slots, " << poolStats.inUseViewports << " in use, efficiency "
              << poolStats.poolEfficiency << "%\n";
    std::cout << "Pool health: " << (health.healthy ? "ok" : "degraded") << "\n";
    for (const auto& issue : health.issues) {
        std::cout << "  issue: " << issue << "\n";
    }

    scheduler.dispose();
    activation->dispose();
    pool->dispose();
    return 0;
}
