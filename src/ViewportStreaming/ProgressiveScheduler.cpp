#include "ViewportStreaming/ProgressiveScheduler.h"
#include "ProgressiveSchedulerImpl.h"

namespace vp_stream {

ProgressiveScheduler::ProgressiveScheduler(const SchedulerOptions& options, std::shared_ptr<ItemSource> source,
                                           std::shared_ptr<PressureSource> pressure,
                                           std::shared_ptr<LazyActivationLayer> activation)
    : impl_(std::make_unique<Impl>(options, std::move(source), std::move(pressure), std::move(activation))) {}

ProgressiveScheduler::~ProgressiveScheduler() = default;

std::string ProgressiveScheduler::createLoadingSession(const std::string& sessionId,
                                                       const std::vector<std::string>& itemIds,
                                                       const SessionMetadata& metadata, LoadingStrategy strategy,
                                                       const ChunkCallbacks& callbacks) {
    return impl_->createLoadingSession(sessionId, itemIds, metadata, strategy, callbacks);
}

Ticket ProgressiveScheduler::queueSession(const std::string& sessionId, LoadPriority priority) {
    return impl_->queueSession(sessionId, priority);
}

std::string ProgressiveScheduler::loadDataset(const std::vector<std::string>& itemIds,
                                              const LoadDatasetOptions& options) {
    return impl_->loadDataset(itemIds, options);
}

Ticket ProgressiveScheduler::getSessionTicket(const std::string& sessionId) const {
    return impl_->getSessionTicket(sessionId);
}

bool ProgressiveScheduler::cancelSession(const std::string& sessionId) {
    return impl_->cancelSession(sessionId);
}

bool ProgressiveScheduler::cancelChunk(const std::string& chunkId) {
    return impl_->cancelChunk(chunkId);
}

bool ProgressiveScheduler::releaseSession(const std::string& sessionId) {
    return impl_->releaseSession(sessionId);
}

size_t ProgressiveScheduler::processQueue() {
    return impl_->processQueue();
}

void ProgressiveScheduler::start() {
    impl_->start();
}

void ProgressiveScheduler::stop() {
    impl_->stop();
}

bool ProgressiveScheduler::isRunning() const {
    return impl_->isRunning();
}

SessionProgress ProgressiveScheduler::getSessionProgress(const std::string& sessionId) const {
    return impl_->getSessionProgress(sessionId);
}

std::vector<ChunkProgress> ProgressiveScheduler::getSessionChunks(const std::string& sessionId) const {
    return impl_->getSessionChunks(sessionId);
}

ChunkProgress ProgressiveScheduler::getChunkProgress(const std::string& chunkId) const {
    return impl_->getChunkProgress(chunkId);
}

std::vector<ItemResult> ProgressiveScheduler::getChunkResults(const std::string& chunkId) const {
    return impl_->getChunkResults(chunkId);
}

SchedulerStatistics ProgressiveScheduler::getStatistics() const {
    return impl_->getStatistics();
}

size_t ProgressiveScheduler::getActiveChunkCount() const {
    return impl_->getActiveChunkCount();
}

LoadingError ProgressiveScheduler::getLastError() const {
    return impl_->getLastError();
}

void ProgressiveScheduler::setMaxConcurrentChunks(size_t count) {
    impl_->setMaxConcurrentChunks(count);
}

size_t ProgressiveScheduler::getMaxConcurrentChunks() const {
    return impl_->getMaxConcurrentChunks();
}

ProgressiveScheduler::SubscriptionId ProgressiveScheduler::subscribe(
    std::function<void(const SchedulerEvent&)> listener) {
    return impl_->subscribe(std::move(listener));
}

bool ProgressiveScheduler::unsubscribe(SubscriptionId id) {
    return impl_->unsubscribe(id);
}

void ProgressiveScheduler::dispose() {
    impl_->dispose();
}

bool ProgressiveScheduler::isDisposed() const {
    return impl_->isDisposed();
}

} // namespace vp_stream
