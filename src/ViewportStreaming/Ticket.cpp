#include "ViewportStreaming/Ticket.h"
#include "Internal/TicketImpl.h"

namespace vp_stream {

Ticket::Ticket() = default;
Ticket::Ticket(std::shared_ptr<TicketImpl> impl) : impl_(std::move(impl)) {}

bool Ticket::valid() const {
    return impl_ != nullptr;
}

int Ticket::numTasksTotal() const {
    return impl_ ? impl_->numTasksTotal() : 0;
}

int Ticket::numTasksRemaining() const {
    return impl_ ? impl_->numTasksRemaining() : 0;
}

void Ticket::wait() {
    if (impl_) {
        impl_->wait();
    }
}

bool Ticket::waitFor(std::chrono::milliseconds timeout) {
    if (!impl_) {
        return true;
    }
    return impl_->waitFor(timeout);
}

}  // namespace vp_stream
