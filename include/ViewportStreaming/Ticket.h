#pragma once

#include <chrono>
#include <memory>

namespace vp_stream {

class TicketImpl;

/// A Ticket tracks completion of the chunks of one queued loading session.
/// A chunk counts as finished once it is completed, errored or cancelled.
class Ticket {
public:
    Ticket();

    // Construct from an existing implementation handle.
    explicit Ticket(std::shared_ptr<TicketImpl> impl);

    /// False for a default-constructed ticket (e.g. queueing an unknown session).
    bool valid() const;

    /// Returns total task count; 0 for an invalid ticket.
    int numTasksTotal() const;

    /// Returns tasks not yet finished; 0 for an invalid ticket.
    int numTasksRemaining() const;

    /// Blocks until every task finishes. Returns immediately for an invalid ticket.
    void wait();

    /// Blocks until every task finishes or the timeout elapses. Returns true when finished.
    bool waitFor(std::chrono::milliseconds timeout);

private:
    std::shared_ptr<TicketImpl> impl_;

    friend class TicketImpl;
};

}  // namespace vp_stream
