#pragma once

/// @file SessionInfo.h
/// @brief Descriptive metadata attached to a loading session.

#include <string>

namespace vp_stream {

/// Identifies what a session loads. All fields are informational only.
struct SessionMetadata {
    std::string studyUid;
    std::string seriesUid;
    std::string modality;
};

/// Human-readable label for log lines, e.g. "CT 1.2.3/4.5.6".
inline std::string describeSession(const SessionMetadata& metadata)
{
    std::string out = metadata.modality.empty() ? std::string("?") : metadata.modality;
    if (!metadata.studyUid.empty() || !metadata.seriesUid.empty()) {
        out += " " + metadata.studyUid + "/" + metadata.seriesUid;
    }
    return out;
}

}  // namespace vp_stream
