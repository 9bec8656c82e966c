#include "TreeEvictor.hpp"
#include "log/TaggedLogger.hpp"

namespace JL {

auto TreeEvictor::sweep(std::shared_ptr<LazyNode> const& root, SweepPolicy const& policy) -> SweepResult {
    SweepResult result;
    if (!root || policy.kind == CleanupKind::None)
        return result;
    this->visit(root, policy, result);
    jl_log("TreeEvictor::sweep " + std::string{cleanupKindToString(policy.kind)} + " visited=" + std::to_string(result.visited)
                   + " evicted=" + std::to_string(result.nodesEvicted) + " released=" + std::to_string(result.nodesReleased),
           "Memory");
    return result;
}

// Returns true when a load is in flight at or below node.
auto TreeEvictor::visit(std::shared_ptr<LazyNode> const& node, SweepPolicy const& policy, SweepResult& result) -> bool {
    ++result.visited;
    bool loading = node->isLoading();
    for (auto const& child : node->children()) {
        if (this->visit(child, policy, result))
            loading = true;
    }

    bool const pinned = loading || node->isExpanded() || (policy.focus && node->path().isPrefixOf(*policy.focus));
    if (pinned || !node->isLoaded() || !this->eligible(*node, policy))
        return loading;

    if (auto released = node->tryEvict()) {
        ++result.nodesEvicted;
        result.nodesReleased += *released;
        result.evicted.push_back(EvictedNode{node->path(), *released});
    }
    return false;
}

auto TreeEvictor::eligible(LazyNode const& node, SweepPolicy const& policy) const -> bool {
    if (policy.minDepth && node.path().depth() <= *policy.minDepth)
        return false;
    if (policy.kind == CleanupKind::Regular)
        return policy.now - node.lastTouched() >= policy.idleGrace;
    return true;
}

} // namespace JL
