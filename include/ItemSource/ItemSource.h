#pragma once

/// @file ItemSource.h
/// @brief Interface for fetching the content items of a loading session.

#include "ViewportStreaming/CancellationToken.h"

#include <cstddef>
#include <string>

namespace vp_stream {

/// Outcome of fetching one item
struct ItemFetchResult {
    bool ok = false;
    size_t sizeBytes = 0;
    std::string error;
};

/// Interface for an item source (network loader, DICOM cache, ...).
/// fetch() is called from scheduler worker threads and must be thread-safe.
class ItemSource
{
  public:
    static constexpr size_t kDefaultItemBytes = 512 * 1024;

    virtual ~ItemSource() = default;

    /// Fetch one item. Long-running implementations should poll token.isCancelled()
    /// and return early with ok == false once it trips.
    virtual ItemFetchResult fetch(const std::string& itemId, const CancellationToken& token) = 0;

    /// Expected size of an item before it is fetched. Used for byte totals.
    virtual size_t estimateSize(const std::string& itemId) const
    {
        (void)itemId;
        return kDefaultItemBytes;
    }
};

}  // namespace vp_stream
