#include "ViewportStreaming/ViewportPool.h"
#include "ViewportPoolImpl.h"

namespace vp_stream {

ViewportPool::ViewportPool(const ViewportPoolOptions& options, std::shared_ptr<SlotBackend> backend,
                           std::shared_ptr<PressureSource> pressure)
    : impl_(std::make_unique<Impl>(options, std::move(backend), std::move(pressure))) {}

ViewportPool::~ViewportPool() = default;

ViewportHandle ViewportPool::acquire(ContentType type, const std::string& contentId) {
    return impl_->acquire(type, contentId);
}

bool ViewportPool::release(uint32_t poolId) {
    return impl_->release(poolId);
}

GarbageCollectionResult ViewportPool::runGarbageCollection() {
    return impl_->runGarbageCollection();
}

bool ViewportPool::checkMemoryPressure() {
    return impl_->checkMemoryPressure();
}

PooledViewport ViewportPool::getSlot(uint32_t poolId) const {
    return impl_->getSlot(poolId);
}

std::vector<PooledViewport> ViewportPool::getSlots() const {
    return impl_->getSlots();
}

size_t ViewportPool::size() const {
    return impl_->size();
}

size_t ViewportPool::estimateMemoryUsage() const {
    return impl_->estimateMemoryUsage();
}

PoolStatistics ViewportPool::getStatistics() const {
    return impl_->getStatistics();
}

PoolHealth ViewportPool::getHealthStatus() const {
    return impl_->getHealthStatus();
}

const ViewportPoolOptions& ViewportPool::getOptions() const {
    return impl_->getOptions();
}

LoadingError ViewportPool::getLastError() const {
    return impl_->getLastError();
}

ViewportPool::SubscriptionId ViewportPool::subscribe(std::function<void(const PoolEvent&)> listener) {
    return impl_->subscribe(std::move(listener));
}

bool ViewportPool::unsubscribe(SubscriptionId id) {
    return impl_->unsubscribe(id);
}

void ViewportPool::dispose() {
    impl_->dispose();
}

bool ViewportPool::isDisposed() const {
    return impl_->isDisposed();
}

} // namespace vp_stream
