#include "LoadTicket.hpp"
#include "log/TaggedLogger.hpp"

namespace JL {

namespace detail {

LoadOperation::LoadOperation(std::shared_ptr<LazyNode> node, bool append, std::size_t offset, std::size_t limit, std::shared_ptr<LoadCounters> counters)
    : node(std::move(node)), append(append), offset(offset), limit(limit), counters(std::move(counters)) {
    this->path = this->node->path();
}

auto LoadOperation::resolve(Expected<LoadOutcome> outcome) -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->result = std::move(outcome);
    }
    this->cv.notify_all();
}

auto LoadOperation::cancel() -> void {
    this->token.cancel();
    auto expected = OperationPhase::Queued;
    if (!this->phase.compare_exchange_strong(expected, OperationPhase::Done))
        return;
    this->node->cancelLoad();
    ++this->counters->cancelled;
    jl_log("LoadOperation::cancel before start: " + this->path.toString(), "Loader");
    this->resolve(std::unexpected(Error{Error::Code::Cancelled, "load of " + this->path.toString() + " cancelled"}));
}

} // namespace detail

auto LoadTicket::Ready(Path path, Expected<LoadOutcome> outcome) -> LoadTicket {
    LoadTicket ticket;
    ticket.path_     = std::move(path);
    ticket.immediate = std::move(outcome);
    return ticket;
}

auto LoadTicket::Attached(std::shared_ptr<detail::LoadOperation> operation, std::chrono::milliseconds defaultTimeout, bool coalesced) -> LoadTicket {
    LoadTicket ticket;
    ticket.path_          = operation->path;
    ticket.operation      = std::move(operation);
    ticket.defaultTimeout = defaultTimeout;
    ticket.coalesced_     = coalesced;
    return ticket;
}

auto LoadTicket::ready() const -> bool {
    if (this->immediate)
        return true;
    if (!this->operation)
        return false;
    std::lock_guard<std::mutex> lock(this->operation->mutex);
    return this->operation->result.has_value();
}

auto LoadTicket::wait() const -> Expected<LoadOutcome> {
    return this->waitFor(this->defaultTimeout);
}

auto LoadTicket::waitFor(std::chrono::milliseconds timeout) const -> Expected<LoadOutcome> {
    if (this->immediate)
        return *this->immediate;
    if (!this->operation)
        return std::unexpected(Error{Error::Code::UnknownError, "empty load ticket"});

    std::unique_lock<std::mutex> lock(this->operation->mutex);
    if (!this->operation->cv.wait_for(lock, timeout, [this] { return this->operation->result.has_value(); })) {
        ++this->operation->counters->timeouts;
        jl_log("LoadTicket::waitFor timed out on " + this->path_.toString(), "Loader");
        return std::unexpected(Error{Error::Code::Timeout,
                                     "load of " + this->path_.toString() + " did not finish within "
                                             + std::to_string(timeout.count()) + " ms"});
    }
    return *this->operation->result;
}

auto LoadTicket::cancel() const -> void {
    if (this->operation)
        this->operation->cancel();
}

} // namespace JL
