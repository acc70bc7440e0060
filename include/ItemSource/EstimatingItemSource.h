#pragma once

/// @file EstimatingItemSource.h
/// @brief Item source that reports estimated sizes without doing any I/O.

#include "ItemSource/ItemSource.h"

#include <atomic>

namespace vp_stream {

/// Fallback source used when the scheduler has no real loader attached.
/// Every fetch succeeds immediately with the estimated size unless the token
/// is already cancelled.
class EstimatingItemSource : public ItemSource
{
  public:
    explicit EstimatingItemSource(size_t bytesPerItem = kDefaultItemBytes);

    ItemFetchResult fetch(const std::string& itemId, const CancellationToken& token) override;
    size_t estimateSize(const std::string& itemId) const override;

    /// Number of successful fetches served so far.
    unsigned long long getNumFetches() const { return numFetches_.load(); }

  private:
    size_t bytesPerItem_;
    std::atomic<unsigned long long> numFetches_{0};
};

}  // namespace vp_stream
