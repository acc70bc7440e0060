#include "ViewportStreaming/LazyActivationLayer.h"
#include "LazyActivationLayerImpl.h"

namespace vp_stream {

LazyActivationLayer::LazyActivationLayer(const ActivationOptions& options,
                                         std::shared_ptr<ViewportMaterializer> materializer,
                                         std::shared_ptr<ViewportPool> pool)
    : impl_(std::make_unique<Impl>(options, std::move(materializer), std::move(pool))) {}

LazyActivationLayer::~LazyActivationLayer() = default;

bool LazyActivationLayer::registerViewport(const std::string& viewportId, const ViewportMetadata& metadata) {
    return impl_->registerViewport(viewportId, metadata);
}

bool LazyActivationLayer::unregisterViewport(const std::string& viewportId) {
    return impl_->unregisterViewport(viewportId);
}

bool LazyActivationLayer::activateViewport(const std::string& viewportId, SurfaceHandle surface, bool immediate) {
    return impl_->activateViewport(viewportId, surface, immediate);
}

bool LazyActivationLayer::deactivateViewport(const std::string& viewportId) {
    return impl_->deactivateViewport(viewportId);
}

bool LazyActivationLayer::preloadViewport(const std::string& viewportId) {
    return impl_->preloadViewport(viewportId);
}

ViewportInfo LazyActivationLayer::getViewportState(const std::string& viewportId) const {
    return impl_->getViewportState(viewportId);
}

std::vector<std::string> LazyActivationLayer::getActiveViewports() const {
    return impl_->getActiveViewports();
}

std::vector<std::string> LazyActivationLayer::getLoadingQueue() const {
    return impl_->getLoadingQueue();
}

MemoryUsage LazyActivationLayer::getMemoryUsage() const {
    return impl_->getMemoryUsage();
}

std::vector<ViewportPrediction> LazyActivationLayer::predictNextViewports() const {
    return impl_->predictNextViewports();
}

LoadingError LazyActivationLayer::getLastError() const {
    return impl_->getLastError();
}

void LazyActivationLayer::setViewportPriority(const std::string& viewportId, int priority) {
    impl_->setViewportPriority(viewportId, priority);
}

void LazyActivationLayer::setPredictiveLoading(bool enabled) {
    impl_->setPredictiveLoading(enabled);
}

bool LazyActivationLayer::isPredictiveLoadingEnabled() const {
    return impl_->isPredictiveLoadingEnabled();
}

LazyActivationLayer::SubscriptionId LazyActivationLayer::subscribe(std::function<void(const ActivationEvent&)> listener) {
    return impl_->subscribe(std::move(listener));
}

bool LazyActivationLayer::unsubscribe(SubscriptionId id) {
    return impl_->unsubscribe(id);
}

void LazyActivationLayer::dispose() {
    impl_->dispose();
}

bool LazyActivationLayer::isDisposed() const {
    return impl_->isDisposed();
}

} // namespace vp_stream
