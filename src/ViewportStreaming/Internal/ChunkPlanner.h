// SPDX-License-Identifier: MIT
// Chunk sizing and priority rules for loading sessions

#pragma once

#include <ViewportStreaming/ProgressiveScheduler.h>

#include <cstddef>
#include <utility>
#include <vector>

namespace vp_stream {
namespace internal {

/// Inputs to adaptive chunk sizing
struct ChunkSizingInputs {
    size_t baseChunkSize = 10;
    size_t totalItems = 0;
    LoadingStrategy strategy = LoadingStrategy::Adaptive;
    double networkBytesPerSecond = 1024.0 * 1024.0;
    double memoryUsage = 0.5;     // fraction in [0, 1]
    bool adaptive = true;
    bool networkAdaptation = true;
};

/// Scale factor applied to the base chunk size
double chunkSizeMultiplier(const ChunkSizingInputs& in);

/// Final chunk size, always >= 1. With adaptive sizing the result is
/// max(1, floor(base * multiplier)) capped at min(50, ceil(total / 10)).
size_t computeChunkSize(const ChunkSizingInputs& in);

/// Priority of chunk chunkIndex out of totalChunks under strategy
LoadPriority chunkPriority(size_t chunkIndex, size_t totalChunks, LoadingStrategy strategy);

/// Contiguous [begin, end) ranges covering totalItems in steps of chunkSize
std::vector<std::pair<size_t, size_t>> partitionItems(size_t totalItems, size_t chunkSize);

} // namespace internal
} // namespace vp_stream
