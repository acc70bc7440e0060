#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace vp_stream {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Error codes
enum class LoadingError {
    Success = 0,
    NotFound,
    InvalidParameter,
    AlreadyExists,
    PoolExhausted,
    AdmissionDenied,
    DuplicateContent,
    InvalidState,
    Timeout,
    Cancelled,
    ItemFetchFailed,
    BackendError,
    Disposed
};

const char* getErrorString(LoadingError error);

// Kind of content a viewport slot is prepared for
enum class ContentType {
    Stack = 0,
    Volume = 1
};

const char* contentTypeName(ContentType type);

// Opaque surface supplied by the UI layer (DOM element, native window, ...)
using SurfaceHandle = void*;

// Opaque rendering resources owned by a pool slot
struct SlotResources {
    uint64_t renderingEngineHandle = 0;
    uint64_t viewportHandle = 0;
    void* userData = nullptr;
};

// Handle to a pooled viewport slot, returned by ViewportPool::acquire
struct ViewportHandle {
    uint32_t poolId = 0;
    bool valid = false;
    ContentType type = ContentType::Stack;
    std::string contentId;
    SlotResources resources{};
    LoadingError error = LoadingError::Success;
};

/// Milliseconds elapsed between two time points, never negative.
inline int64_t elapsedMs(TimePoint from, TimePoint to) {
    if (to <= from) return 0;
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

} // namespace vp_stream
