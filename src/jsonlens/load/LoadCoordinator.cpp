#include "LoadCoordinator.hpp"
#include "log/TaggedLogger.hpp"
#include "tree/TreeMaterializer.hpp"

#include <algorithm>
#include <exception>

namespace JL {

namespace {

auto snapshotOf(LazyNode const& node) -> LoadOutcome {
    return LoadOutcome{node.children(), node.childCount(), node.isPartial()};
}

auto isCancellation(Error const& error) -> bool {
    return error.code == Error::Code::Cancelled || error.code == Error::Code::Timeout;
}

} // namespace

LoadCoordinator::LoadCoordinator(std::shared_ptr<Document const> document, LoaderConfig config, EventChannel* events)
    : document(std::move(document)),
      config_(std::move(config)),
      events(events),
      counters(std::make_shared<LoadCounters>()),
      pool(this->config_.maxConcurrentLoads, "Loader") {}

LoadCoordinator::~LoadCoordinator() {
    this->shutdown();
}

auto LoadCoordinator::expand(std::shared_ptr<LazyNode> const& node, ExpandRequest request) -> LoadTicket {
    if (!node)
        return LoadTicket::Ready(Path{}, std::unexpected(Error{Error::Code::NoSuchPath, "expand called without a node"}));

    if (request.markExpanded) {
        node->setExpanded(true);
        this->publish(Event{.kind = EventKind::NodeUpdated, .path = node->path()});
    }
    if (!node->isContainer())
        return LoadTicket::Ready(node->path(), LoadOutcome{});

    return this->start(node, false, request.limit.value_or(this->config_.childLimit));
}

auto LoadCoordinator::loadMore(std::shared_ptr<LazyNode> const& node, std::optional<std::size_t> count) -> LoadTicket {
    if (!node)
        return LoadTicket::Ready(Path{}, std::unexpected(Error{Error::Code::NoSuchPath, "loadMore called without a node"}));
    if (!node->isContainer())
        return LoadTicket::Ready(node->path(), LoadOutcome{});
    return this->start(node, true, count.value_or(this->config_.childLimit));
}

auto LoadCoordinator::start(std::shared_ptr<LazyNode> const& node, bool append, std::size_t limit) -> LoadTicket {
    auto const& path = node->path();
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->shuttingDown)
        return LoadTicket::Ready(path, std::unexpected(Error{Error::Code::ShuttingDown, "load coordinator is shutting down"}));

    if (auto it = this->inFlight.find(path); it != this->inFlight.end()) {
        if (it->second->phase.load() != detail::OperationPhase::Done) {
            ++this->counters->coalesced;
            jl_log("LoadCoordinator: coalescing request for " + path.toString(), "Loader");
            return LoadTicket::Attached(it->second, this->config_.loadTimeout, true);
        }
        this->inFlight.erase(it);
    }

    // Claim the node first and decide afterwards, so an eviction racing this
    // request turns it into a fresh load instead of a busy error.
    std::size_t offset = 0;
    if (node->beginAppend()) {
        auto const attached = node->loadedChildCount();
        auto const target   = std::min(append ? attached + limit : limit, node->childCount());
        if (attached >= target) {
            node->cancelLoad();
            return LoadTicket::Ready(path, snapshotOf(*node));
        }
        append = true;
        offset = attached;
        limit  = target - attached;
    } else if (node->beginLoad()) {
        append = false;
        limit  = std::min(limit, node->childCount());
    } else {
        jl_log("LoadCoordinator: node busy outside the coordinator: " + path.toString(), "Loader", "Warning");
        return LoadTicket::Ready(path, std::unexpected(Error{Error::Code::UnknownError, "node is busy: " + path.toString()}));
    }

    auto operation = std::make_shared<Operation>(node, append, offset, limit, this->counters);
    auto task      = Task::Create([this, operation] { this->run(operation); }, "load " + path.toString());
    if (auto error = this->pool.submit(task)) {
        node->cancelLoad();
        return LoadTicket::Ready(path, std::unexpected(std::move(*error)));
    }
    this->inFlight[path] = operation;
    jl_log("LoadCoordinator: queued load of " + path.toString() + " offset=" + std::to_string(offset) + " limit=" + std::to_string(limit), "Loader");
    return LoadTicket::Attached(std::move(operation), this->config_.loadTimeout, false);
}

auto LoadCoordinator::run(std::shared_ptr<Operation> const& operation) -> void {
    auto expected = detail::OperationPhase::Queued;
    if (!operation->phase.compare_exchange_strong(expected, detail::OperationPhase::Running))
        return;

    ++this->counters->materializationPasses;
    BatchHook hook;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        hook = this->batchHook;
    }

    MaterializeOptions const options{.offset        = operation->offset,
                                     .limit         = operation->limit,
                                     .batchSize     = this->config_.batchSize,
                                     .previewLength = this->config_.previewLength};
    auto& node = *operation->node;
    Expected<MaterializeResult> result;
    try {
        result = materializeChildren(*this->document, operation->path, options, operation->token, [&](LazyNode::Children const& batch) {
            node.appendChildren(batch);
            this->publish(Event{.kind = EventKind::ChildrenBatch, .path = operation->path, .count = batch.size()});
            if (hook)
                hook(operation->path, node.loadedChildCount());
        });
    } catch (std::exception const& error) {
        result = std::unexpected(Error{Error::Code::UnknownError, "load of " + operation->path.toString() + " aborted: " + error.what()});
    }

    if (!result) {
        auto const& error = result.error();
        if (isCancellation(error)) {
            node.cancelLoad();
            ++this->counters->cancelled;
            jl_log("LoadCoordinator: load of " + operation->path.toString() + " cancelled", "Loader");
        } else {
            node.failLoad(error);
            ++this->counters->failed;
            jl_log("LoadCoordinator: load of " + operation->path.toString() + " failed: " + describeError(error), "Loader", "Error");
            this->publish(Event{.kind = EventKind::LoadFailed, .path = operation->path, .error = error});
        }
        this->finish(operation, std::unexpected(error));
        return;
    }

    node.completeLoad();
    ++this->counters->completed;
    auto outcome = LoadOutcome{node.children(), result->totalCount, node.isPartial()};
    this->publish(Event{.kind = EventKind::ChildrenLoaded, .path = operation->path, .count = outcome.children.size()});
    this->finish(operation, std::move(outcome));
}

auto LoadCoordinator::finish(std::shared_ptr<Operation> const& operation, Expected<LoadOutcome> outcome) -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (auto it = this->inFlight.find(operation->path); it != this->inFlight.end() && it->second == operation)
            this->inFlight.erase(it);
    }
    operation->phase.store(detail::OperationPhase::Done);
    operation->resolve(std::move(outcome));
}

auto LoadCoordinator::preloadChildren(std::shared_ptr<LazyNode> const& node, std::optional<std::size_t> count) -> Expected<std::size_t> {
    auto loaded = this->expand(node, ExpandRequest{.markExpanded = false}).wait();
    if (!loaded)
        return std::unexpected(std::move(loaded.error()));

    auto const          wanted = count.value_or(this->config_.preloadCount);
    std::vector<LoadTicket> tickets;
    for (auto const& child : loaded->children) {
        if (tickets.size() >= wanted)
            break;
        if (child->isExpandable() && !child->isLoaded())
            tickets.push_back(this->expand(child, ExpandRequest{.markExpanded = false}));
    }

    std::size_t preloaded = 0;
    for (auto const& ticket : tickets) {
        if (ticket.wait())
            ++preloaded;
    }
    jl_log("LoadCoordinator: preloaded " + std::to_string(preloaded) + " children of " + node->path().toString(), "Loader");
    return preloaded;
}

auto LoadCoordinator::loadMany(std::vector<std::shared_ptr<LazyNode>> const& nodes) -> std::map<Path, bool> {
    std::vector<LoadTicket> tickets;
    tickets.reserve(nodes.size());
    for (auto const& node : nodes)
        tickets.push_back(this->expand(node, ExpandRequest{.markExpanded = false}));

    std::map<Path, bool> results;
    for (auto const& ticket : tickets)
        results[ticket.path()] = ticket.wait().has_value();
    return results;
}

auto LoadCoordinator::cancel(Path const& path) -> bool {
    std::shared_ptr<Operation> operation;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        auto it = this->inFlight.find(path);
        if (it == this->inFlight.end())
            return false;
        operation = it->second;
    }
    operation->cancel();
    std::lock_guard<std::mutex> lock(this->mutex);
    if (auto it = this->inFlight.find(path); it != this->inFlight.end() && it->second == operation
                                              && operation->phase.load() == detail::OperationPhase::Done)
        this->inFlight.erase(it);
    return true;
}

auto LoadCoordinator::cancelAll() -> std::size_t {
    std::vector<std::shared_ptr<Operation>> operations;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        operations.reserve(this->inFlight.size());
        for (auto const& [path, operation] : this->inFlight)
            operations.push_back(operation);
    }
    for (auto const& operation : operations)
        operation->cancel();

    std::lock_guard<std::mutex> lock(this->mutex);
    for (auto const& operation : operations) {
        if (auto it = this->inFlight.find(operation->path); it != this->inFlight.end() && it->second == operation
                                                             && operation->phase.load() == detail::OperationPhase::Done)
            this->inFlight.erase(it);
    }
    if (!operations.empty())
        jl_log("LoadCoordinator: cancelled " + std::to_string(operations.size()) + " loads", "Loader");
    return operations.size();
}

auto LoadCoordinator::status() const -> LoaderStatus {
    LoaderStatus status;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        for (auto const& [path, operation] : this->inFlight) {
            if (operation->phase.load() != detail::OperationPhase::Done)
                ++status.inFlight;
        }
    }
    status.queued                = this->pool.queued();
    status.completed             = this->counters->completed.load();
    status.failed                = this->counters->failed.load();
    status.cancelled             = this->counters->cancelled.load();
    status.coalesced             = this->counters->coalesced.load();
    status.timeouts              = this->counters->timeouts.load();
    status.materializationPasses = this->counters->materializationPasses.load();
    return status;
}

auto LoadCoordinator::setBatchHook(BatchHook hook) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->batchHook = std::move(hook);
}

auto LoadCoordinator::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown)
            return;
        this->shuttingDown = true;
    }
    jl_log("LoadCoordinator::shutdown", "Loader");
    this->cancelAll();
    this->pool.shutdown();
}

auto LoadCoordinator::publish(Event event) -> void {
    if (this->events == nullptr)
        return;
    try {
        this->events->publish(std::move(event));
    } catch (std::exception const& error) {
        jl_log(std::string{"LoadCoordinator: event listener threw: "} + error.what(), "Loader", "Error");
    }
}

} // namespace JL
