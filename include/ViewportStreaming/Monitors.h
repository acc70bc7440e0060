#pragma once

#include "ViewportStreaming/Types.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace vp_stream {

/// Source of a resource-pressure reading in [0, 1].
/// reading() may be called from any thread.
class PressureSource {
public:
    virtual ~PressureSource() = default;
    virtual double reading() const = 0;
};

/// Pressure source returning a value set by the caller. Thread-safe.
class FixedPressureSource : public PressureSource {
public:
    explicit FixedPressureSource(double value = 0.5) : value_(value) {}

    double reading() const override { return value_.load(); }
    void set(double value) { value_.store(value); }

private:
    std::atomic<double> value_;
};

/// Fraction of physical memory in use, from /proc/meminfo.
/// Falls back to 0.5 where the file is missing or unparsable.
class SystemMemoryPressureSource : public PressureSource {
public:
    explicit SystemMemoryPressureSource(std::string meminfoPath = "/proc/meminfo");
    double reading() const override;

private:
    std::string path_;
};

/// Rolling estimate of transfer speed over the last few transfers.
class NetworkMonitor {
public:
    static constexpr size_t kMaxHistory = 10;
    static constexpr double kDefaultBytesPerSecond = 1024.0 * 1024.0;

    void startTransfer(const std::string& id);

    /// Record the end of a transfer started with startTransfer(). Unknown ids are ignored.
    void endTransfer(const std::string& id, size_t bytesTransferred);

    /// Record a completed transfer directly.
    void recordTransfer(size_t bytesTransferred, std::chrono::milliseconds duration);

    /// Mean bytes/second of the recorded window, 1 MiB/s when empty.
    double getAverageSpeed() const;

    size_t getSampleCount() const;
    void reset();

private:
    void pushSampleLocked(double bytesPerSecond);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, TimePoint> transfers_;
    std::deque<double> history_;
};

/// Memory usage as seen through an optional pressure source.
class MemoryMonitor {
public:
    static constexpr double kDefaultUsage = 0.5;

    explicit MemoryMonitor(std::shared_ptr<PressureSource> source = nullptr, double threshold = 0.8)
        : source_(std::move(source)), threshold_(threshold) {}

    /// Current usage clamped to [0, 1]; 0.5 when no source is attached.
    double getCurrentUsage() const;

    bool isOverThreshold() const { return getCurrentUsage() > threshold_; }
    double getThreshold() const { return threshold_; }

private:
    std::shared_ptr<PressureSource> source_;
    double threshold_;
};

} // namespace vp_stream
