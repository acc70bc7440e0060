#include "ViewportStreaming/Types.h"

namespace vp_stream {

const char* getErrorString(LoadingError error) {
    switch (error) {
        case LoadingError::Success: return "Success";
        case LoadingError::NotFound: return "Not found";
        case LoadingError::InvalidParameter: return "Invalid parameter";
        case LoadingError::AlreadyExists: return "Already exists";
        case LoadingError::PoolExhausted: return "Viewport pool exhausted";
        case LoadingError::AdmissionDenied: return "Admission denied";
        case LoadingError::DuplicateContent: return "Content already bound to a viewport";
        case LoadingError::InvalidState: return "Invalid state";
        case LoadingError::Timeout: return "Timed out";
        case LoadingError::Cancelled: return "Cancelled";
        case LoadingError::ItemFetchFailed: return "Item fetch failed";
        case LoadingError::BackendError: return "Rendering backend error";
        case LoadingError::Disposed: return "Disposed";
        default: return "Unknown error";
    }
}

const char* contentTypeName(ContentType type) {
    switch (type) {
        case ContentType::Stack: return "stack";
        case ContentType::Volume: return "volume";
    }
    return "unknown";
}

} // namespace vp_stream
