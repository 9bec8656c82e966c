#pragma once
#include "core/Error.hpp"
#include "document/NodeKind.hpp"
#include "path/Path.hpp"
#include "tree/NodeState.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace JL {

/**
 * Navigable unit of the tree view over a Document.
 *
 * Structure:
 * - identity: path (unique, stable), display key, kind
 * - preview: display value and declared child count, both known without
 *   materializing any children
 * - children: materialized on demand by the load coordinator and dropped again
 *   by the memory monitor
 *
 * Notes:
 * - No parent pointer is stored. The parent is the node at path().parent(),
 *   so the graph has no back references.
 * - The NodeStateAtomic is the only mutual-exclusion point between loading and
 *   eviction. Children are mutated under childMutex and handed out as snapshots,
 *   so readers never observe a list that is being rewritten.
 * - Eviction happens under childMutex together with the Loaded -> Idle
 *   transition; completeLoad() publishes children under the same mutex. A load
 *   that starts right after an eviction can therefore never lose its children
 *   to that eviction.
 */
class LazyNode {
public:
    using Clock    = std::chrono::steady_clock;
    using Children = std::vector<std::shared_ptr<LazyNode>>;

    LazyNode(Path path, std::string key, NodeKind kind, std::string displayValue, std::size_t childCount, Json scalar = nullptr);

    LazyNode(LazyNode const&)                    = delete;
    auto operator=(LazyNode const&) -> LazyNode& = delete;

    [[nodiscard]] auto path() const -> Path const& { return this->path_; }
    [[nodiscard]] auto key() const -> std::string const& { return this->key_; }
    [[nodiscard]] auto kind() const -> NodeKind { return this->kind_; }
    [[nodiscard]] auto displayValue() const -> std::string const& { return this->displayValue_; }
    [[nodiscard]] auto childCount() const -> std::size_t { return this->childCount_; }
    // Raw value of a leaf; null for containers.
    [[nodiscard]] auto scalar() const -> Json const& { return this->scalar_; }
    [[nodiscard]] auto isContainer() const -> bool { return JL::isContainer(this->kind_); }
    [[nodiscard]] auto isExpandable() const -> bool { return this->childCount_ > 0; }

    [[nodiscard]] auto isExpanded() const -> bool { return this->expanded.load(std::memory_order_acquire); }
    auto setExpanded(bool value, Clock::time_point now = Clock::now()) -> void;

    [[nodiscard]] auto state() const -> LoadState { return this->state_.get(); }
    [[nodiscard]] auto isLoaded() const -> bool { return this->state_.isLoaded(); }
    [[nodiscard]] auto isLoading() const -> bool { return this->state_.isLoading(); }
    // Loaded, but children remain past the attached range.
    [[nodiscard]] auto isPartial() const -> bool;
    [[nodiscard]] auto lastError() const -> std::optional<Error>;

    [[nodiscard]] auto lastTouched() const -> Clock::time_point;
    auto touch(Clock::time_point now = Clock::now()) -> void;

    [[nodiscard]] auto children() const -> Children;
    [[nodiscard]] auto loadedChildCount() const -> std::size_t;
    // Materialized child for a segment, or null.
    [[nodiscard]] auto childFor(PathSegment const& segment) const -> std::shared_ptr<LazyNode>;

    // Load protocol, driven by the load coordinator. begin* returns false when another pass owns the node.
    auto beginLoad() -> bool;
    auto beginAppend() -> bool;
    auto appendChildren(Children batch) -> void;
    auto completeLoad() -> void;
    auto failLoad(Error error) -> void;
    auto cancelLoad() -> void;

    // Drops the children of a Loaded node and returns how many nodes were released,
    // descendants included. nullopt when the node was not Loaded.
    auto tryEvict() -> std::optional<std::size_t>;

private:
    Path        path_;
    std::string key_;
    NodeKind    kind_;
    std::string displayValue_;
    std::size_t childCount_ = 0;
    Json        scalar_;

    std::atomic<bool>              expanded{false};
    std::atomic<Clock::rep>        touched;
    NodeStateAtomic                state_;

    mutable std::mutex   childMutex;
    Children             children_;
    bool                 appending = false;
    std::optional<Error> error_;
};

// Number of materialized descendants below node (node itself excluded).
auto countMaterialized(LazyNode const& node) -> std::size_t;

} // namespace JL
