#include "Internal/ChunkPlanner.h"

#include <algorithm>
#include <cmath>

namespace vp_stream {
namespace internal {

namespace {

constexpr double kFastNetwork = 10.0 * 1024.0 * 1024.0;
constexpr double kSlowNetwork = 1.0 * 1024.0 * 1024.0;
constexpr double kHighMemory = 0.8;
constexpr double kLowMemory = 0.4;
constexpr size_t kMaxChunkSize = 50;

} // namespace

double chunkSizeMultiplier(const ChunkSizingInputs& in) {
    double multiplier = 1.0;

    if (in.networkAdaptation) {
        if (in.networkBytesPerSecond > kFastNetwork) {
            multiplier *= 1.5;
        } else if (in.networkBytesPerSecond < kSlowNetwork) {
            multiplier *= 0.5;
        }
    }

    if (in.memoryUsage > kHighMemory) {
        multiplier *= 0.6;
    } else if (in.memoryUsage < kLowMemory) {
        multiplier *= 1.3;
    }

    switch (in.strategy) {
        case LoadingStrategy::Sequential:
            multiplier *= 0.8;  // smaller chunks, finer progress
            break;
        case LoadingStrategy::Predictive:
            multiplier *= 1.2;
            break;
        case LoadingStrategy::PriorityBased:
        case LoadingStrategy::Adaptive:
            break;
    }
    return multiplier;
}

size_t computeChunkSize(const ChunkSizingInputs& in) {
    size_t base = std::max<size_t>(1, in.baseChunkSize);
    if (!in.adaptive) {
        return base;
    }

    double scaled = std::floor(static_cast<double>(base) * chunkSizeMultiplier(in));
    size_t adjusted = scaled < 1.0 ? 1 : static_cast<size_t>(scaled);
    size_t cap = std::min(kMaxChunkSize, (in.totalItems + 9) / 10);
    return std::max<size_t>(1, std::min(adjusted, cap));
}

LoadPriority chunkPriority(size_t chunkIndex, size_t totalChunks, LoadingStrategy strategy) {
    switch (strategy) {
        case LoadingStrategy::Sequential:
            if (chunkIndex == 0) return LoadPriority::Critical;
            if (chunkIndex == 1) return LoadPriority::High;
            return LoadPriority::Normal;

        case LoadingStrategy::PriorityBased: {
            if (totalChunks == 0) return LoadPriority::Critical;
            size_t section = chunkIndex * kPriorityLevels / totalChunks;
            int level = static_cast<int>(std::min<size_t>(kPriorityLevels, section + 1));
            return static_cast<LoadPriority>(level);
        }

        case LoadingStrategy::Predictive: {
            size_t middle = totalChunks / 2;
            size_t distance = chunkIndex > middle ? chunkIndex - middle : middle - chunkIndex;
            if (distance <= 1) return LoadPriority::High;
            if (distance <= 3) return LoadPriority::Normal;
            return LoadPriority::Low;
        }

        case LoadingStrategy::Adaptive:
        default:
            if (chunkIndex < 2) return LoadPriority::High;
            if (static_cast<double>(chunkIndex) < static_cast<double>(totalChunks) * 0.3) return LoadPriority::Normal;
            return LoadPriority::Low;
    }
}

std::vector<std::pair<size_t, size_t>> partitionItems(size_t totalItems, size_t chunkSize) {
    std::vector<std::pair<size_t, size_t>> ranges;
    chunkSize = std::max<size_t>(1, chunkSize);
    for (size_t begin = 0; begin < totalItems; begin += chunkSize) {
        ranges.emplace_back(begin, std::min(totalItems, begin + chunkSize));
    }
    return ranges;
}

} // namespace internal
} // namespace vp_stream
