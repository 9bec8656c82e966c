#pragma once
#include "core/CancellationToken.hpp"
#include "core/Error.hpp"
#include "path/Path.hpp"
#include "tree/LazyNode.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace JL {

// What a finished load hands back to every ticket attached to it.
struct LoadOutcome {
    LazyNode::Children children;       // snapshot of all attached children after the load
    std::size_t        totalCount = 0; // declared cardinality
    bool               partial    = false;
};

struct LoadCounters {
    std::atomic<std::uint64_t> completed{0};
    std::atomic<std::uint64_t> failed{0};
    std::atomic<std::uint64_t> cancelled{0};
    std::atomic<std::uint64_t> coalesced{0};
    std::atomic<std::uint64_t> timeouts{0};
    std::atomic<std::uint64_t> materializationPasses{0};
};

namespace detail {

enum class OperationPhase { Queued, Running, Done };

// One materialization pass for one path; shared by every ticket that coalesced onto it.
struct LoadOperation {
    LoadOperation(std::shared_ptr<LazyNode> node, bool append, std::size_t offset, std::size_t limit, std::shared_ptr<LoadCounters> counters);

    auto resolve(Expected<LoadOutcome> outcome) -> void;
    // Cancels the token; an operation no worker has picked up yet is resolved right away.
    auto cancel() -> void;

    std::shared_ptr<LazyNode>     node;
    Path                          path;
    bool                          append;
    std::size_t                   offset;
    std::size_t                   limit;
    CancellationToken             token;
    std::shared_ptr<LoadCounters> counters;
    std::atomic<OperationPhase>   phase{OperationPhase::Queued};

    std::mutex                           mutex;
    std::condition_variable              cv;
    std::optional<Expected<LoadOutcome>> result;
};

} // namespace detail

/**
 * Caller's handle on a node expansion.
 *
 * Several tickets can share one underlying operation (request coalescing).
 * Timeouts are a caller-side give-up: waitFor() returning Timeout leaves the
 * operation running, and the node is populated when it finishes. cancel()
 * stops the shared operation for every attached ticket.
 */
class LoadTicket {
public:
    LoadTicket() = default;

    static auto Ready(Path path, Expected<LoadOutcome> outcome) -> LoadTicket;
    static auto Attached(std::shared_ptr<detail::LoadOperation> operation, std::chrono::milliseconds defaultTimeout, bool coalesced) -> LoadTicket;

    [[nodiscard]] auto path() const -> Path const& { return this->path_; }
    [[nodiscard]] auto ready() const -> bool;
    // True when this ticket attached to an operation started by an earlier request.
    [[nodiscard]] auto coalesced() const -> bool { return this->coalesced_; }

    // Waits up to the loader's configured timeout.
    auto wait() const -> Expected<LoadOutcome>;
    auto waitFor(std::chrono::milliseconds timeout) const -> Expected<LoadOutcome>;
    auto cancel() const -> void;

private:
    Path                                   path_;
    std::optional<Expected<LoadOutcome>>   immediate;
    std::shared_ptr<detail::LoadOperation> operation;
    std::chrono::milliseconds              defaultTimeout{0};
    bool                                   coalesced_ = false;
};

} // namespace JL
