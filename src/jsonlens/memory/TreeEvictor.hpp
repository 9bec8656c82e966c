#pragma once
#include "memory/PressurePolicy.hpp"
#include "path/Path.hpp"
#include "tree/LazyNode.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace JL {

struct SweepPolicy {
    CleanupKind                           kind = CleanupKind::Regular;
    std::chrono::steady_clock::time_point now  = std::chrono::steady_clock::now();
    // Regular sweeps spare nodes touched more recently than this.
    std::chrono::milliseconds             idleGrace{0};
    // Currently selected node; it and its ancestors keep their children.
    std::optional<Path>                   focus;
    // Only nodes deeper than this are evicted.
    std::optional<std::size_t>            minDepth;
};

struct EvictedNode {
    Path        path;
    std::size_t released = 0;
};

struct SweepResult {
    std::size_t              visited       = 0;
    std::size_t              nodesEvicted  = 0; // nodes whose children were dropped
    std::size_t              nodesReleased = 0; // materialized nodes released, descendants included
    std::vector<EvictedNode> evicted;           // in eviction order; the caller publishes NodeEvicted
};

/**
 * Drops the children of collapsed nodes.
 *
 * A node keeps its children when it is expanded, loading, on the focus path,
 * or when a materialized descendant is loading. An expanded node hidden under
 * a collapsed ancestor does not protect that ancestor. The walk is post-order,
 * so a collapsed subtree is released bottom-up. Safe to run while loads are in
 * flight: eviction only wins the Loaded -> Idle transition.
 *
 * The evictor publishes nothing itself. Callers report result.evicted once
 * they have released their own locks, since event listeners run inline.
 */
class TreeEvictor {
public:
    auto sweep(std::shared_ptr<LazyNode> const& root, SweepPolicy const& policy) -> SweepResult;

private:
    auto visit(std::shared_ptr<LazyNode> const& node, SweepPolicy const& policy, SweepResult& result) -> bool;
    auto eligible(LazyNode const& node, SweepPolicy const& policy) const -> bool;
};

} // namespace JL
