#include "ItemSource/EstimatingItemSource.h"

namespace vp_stream {

EstimatingItemSource::EstimatingItemSource(size_t bytesPerItem)
    : bytesPerItem_(bytesPerItem == 0 ? kDefaultItemBytes : bytesPerItem)
{
}

ItemFetchResult EstimatingItemSource::fetch(const std::string& itemId, const CancellationToken& token)
{
    ItemFetchResult result;
    if (token.isCancelled()) {
        result.error = "cancelled";
        return result;
    }
    result.ok = true;
    result.sizeBytes = estimateSize(itemId);
    ++numFetches_;
    return result;
}

size_t EstimatingItemSource::estimateSize(const std::string& itemId) const
{
    (void)itemId;
    return bytesPerItem_;
}

}  // namespace vp_stream
