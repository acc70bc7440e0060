#include "ViewportStreaming/Monitors.h"
#include "ViewportStreaming/Logging.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <exception>
#include <numeric>

namespace vp_stream {

SystemMemoryPressureSource::SystemMemoryPressureSource(std::string meminfoPath)
    : path_(std::move(meminfoPath)) {}

double SystemMemoryPressureSource::reading() const {
    FILE* file = std::fopen(path_.c_str(), "r");
    if (!file) {
        return MemoryMonitor::kDefaultUsage;
    }

    unsigned long long totalKb = 0;
    unsigned long long availableKb = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), file)) {
        unsigned long long value = 0;
        if (std::strncmp(line, "MemTotal:", 9) == 0 && std::sscanf(line + 9, "%llu", &value) == 1) {
            totalKb = value;
        } else if (std::strncmp(line, "MemAvailable:", 13) == 0 &&
                   std::sscanf(line + 13, "%llu", &value) == 1) {
            availableKb = value;
        }
    }
    std::fclose(file);

    if (totalKb == 0 || availableKb > totalKb) {
        logMessage(LogLevel::Debug, "SystemMemoryPressureSource: unusable %s", path_.c_str());
        return MemoryMonitor::kDefaultUsage;
    }
    return 1.0 - static_cast<double>(availableKb) / static_cast<double>(totalKb);
}

void NetworkMonitor::startTransfer(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    transfers_[id] = Clock::now();
}

void NetworkMonitor::endTransfer(const std::string& id, size_t bytesTransferred) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    if (it == transfers_.end()) {
        return;
    }
    // Sub-millisecond transfers count as one millisecond
    double seconds = std::max<int64_t>(1, elapsedMs(it->second, Clock::now())) / 1000.0;
    transfers_.erase(it);
    pushSampleLocked(static_cast<double>(bytesTransferred) / seconds);
}

void NetworkMonitor::recordTransfer(size_t bytesTransferred, std::chrono::milliseconds duration) {
    double seconds = std::max<int64_t>(1, duration.count()) / 1000.0;
    std::lock_guard<std::mutex> lock(mutex_);
    pushSampleLocked(static_cast<double>(bytesTransferred) / seconds);
}

double NetworkMonitor::getAverageSpeed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (history_.empty()) {
        return kDefaultBytesPerSecond;
    }
    return std::accumulate(history_.begin(), history_.end(), 0.0) / history_.size();
}

size_t NetworkMonitor::getSampleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

void NetworkMonitor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    transfers_.clear();
    history_.clear();
}

void NetworkMonitor::pushSampleLocked(double bytesPerSecond) {
    history_.push_back(bytesPerSecond);
    while (history_.size() > kMaxHistory) {
        history_.pop_front();
    }
}

double MemoryMonitor::getCurrentUsage() const {
    if (!source_) {
        return kDefaultUsage;
    }
    double value = kDefaultUsage;
    try {
        value = source_->reading();
    } catch (const std::exception& e) {
        logMessage(LogLevel::Warn, "MemoryMonitor: pressure source failed: %s", e.what());
        return kDefaultUsage;
    }
    if (!(value >= 0.0)) {
        return 0.0;  // also catches NaN
    }
    return std::min(value, 1.0);
}

} // namespace vp_stream
