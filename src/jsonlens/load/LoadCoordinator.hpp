#pragma once
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "document/Document.hpp"
#include "events/EventChannel.hpp"
#include "load/LoadTicket.hpp"
#include "task/TaskPool.hpp"
#include "tree/LazyNode.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace JL {

struct ExpandRequest {
    // Children to have attached after the load; defaults to LoaderConfig::childLimit.
    std::optional<std::size_t> limit;
    // Set the node's expanded flag (a user expansion) or leave it as is (preloading).
    bool markExpanded = true;
};

struct LoaderStatus {
    std::size_t   inFlight              = 0;
    std::size_t   queued                = 0;
    std::uint64_t completed             = 0;
    std::uint64_t failed                = 0;
    std::uint64_t cancelled             = 0;
    std::uint64_t coalesced             = 0;
    std::uint64_t timeouts              = 0;
    std::uint64_t materializationPasses = 0;
};

/**
 * LoadCoordinator: turns "expand node N" into one deduplicated background load
 *
 * - Operations run on a private TaskPool of LoaderConfig::maxConcurrentLoads
 *   workers; further requests queue.
 * - A request for a path with an operation in flight attaches to it instead of
 *   starting a second materialization (coalescing keyed by path).
 * - Children are attached to the node batch by batch as they are produced;
 *   the node only becomes Loaded once the whole pass finished.
 * - A failed pass leaves the node Failed with the error, a cancelled one leaves
 *   it Idle. Both are retryable through another expand().
 * - After shutdown() every request resolves with ShuttingDown.
 */
class LoadCoordinator {
public:
    // Test hook, called on the worker after each attached batch with the number of children attached so far.
    using BatchHook = std::function<void(Path const&, std::size_t attached)>;

    LoadCoordinator(std::shared_ptr<Document const> document, LoaderConfig config, EventChannel* events = nullptr);
    ~LoadCoordinator();

    LoadCoordinator(LoadCoordinator const&)                    = delete;
    auto operator=(LoadCoordinator const&) -> LoadCoordinator& = delete;

    auto expand(std::shared_ptr<LazyNode> const& node, ExpandRequest request = {}) -> LoadTicket;
    // Appends the next page (default: childLimit children) to a partially loaded node.
    auto loadMore(std::shared_ptr<LazyNode> const& node, std::optional<std::size_t> count = std::nullopt) -> LoadTicket;

    // Loads node, then its first `count` expandable children (default: preloadCount), without marking them expanded.
    // Returns how many children were preloaded.
    auto preloadChildren(std::shared_ptr<LazyNode> const& node, std::optional<std::size_t> count = std::nullopt) -> Expected<std::size_t>;
    // Loads every node in parallel and reports success per path.
    auto loadMany(std::vector<std::shared_ptr<LazyNode>> const& nodes) -> std::map<Path, bool>;

    auto cancel(Path const& path) -> bool;
    auto cancelAll() -> std::size_t;

    [[nodiscard]] auto status() const -> LoaderStatus;
    [[nodiscard]] auto config() const -> LoaderConfig const& { return this->config_; }

    auto setBatchHook(BatchHook hook) -> void;
    auto shutdown() -> void;

private:
    using Operation = detail::LoadOperation;

    // append: limit is a page past the attached children; otherwise the total to have attached.
    auto start(std::shared_ptr<LazyNode> const& node, bool append, std::size_t limit) -> LoadTicket;
    auto run(std::shared_ptr<Operation> const& operation) -> void;
    auto finish(std::shared_ptr<Operation> const& operation, Expected<LoadOutcome> outcome) -> void;
    auto publish(Event event) -> void;

    std::shared_ptr<Document const> document;
    LoaderConfig                    config_;
    EventChannel*                   events;
    std::shared_ptr<LoadCounters>   counters;

    mutable std::mutex                                               mutex;
    phmap::flat_hash_map<Path, std::shared_ptr<Operation>, PathHash> inFlight;
    BatchHook                                                        batchHook;
    std::atomic<bool>                                                shuttingDown{false};

    // Declared last: workers are joined before the state they use goes away.
    TaskPool pool;
};

} // namespace JL
