#include "LazyNode.hpp"
#include "log/TaggedLogger.hpp"

namespace JL {

LazyNode::LazyNode(Path path, std::string key, NodeKind kind, std::string displayValue, std::size_t childCount, Json scalar)
    : path_(std::move(path)),
      key_(std::move(key)),
      kind_(kind),
      displayValue_(std::move(displayValue)),
      childCount_(childCount),
      scalar_(std::move(scalar)),
      touched(Clock::now().time_since_epoch().count()) {}

auto LazyNode::setExpanded(bool value, Clock::time_point now) -> void {
    this->expanded.store(value, std::memory_order_release);
    this->touch(now);
}

auto LazyNode::isPartial() const -> bool {
    std::lock_guard<std::mutex> lock(this->childMutex);
    auto const state = this->state_.get();
    if (state != LoadState::Loaded && !(state == LoadState::Loading && this->appending))
        return false;
    return this->children_.size() < this->childCount_;
}

auto LazyNode::lastError() const -> std::optional<Error> {
    std::lock_guard<std::mutex> lock(this->childMutex);
    return this->error_;
}

auto LazyNode::lastTouched() const -> Clock::time_point {
    return Clock::time_point{Clock::duration{this->touched.load(std::memory_order_relaxed)}};
}

auto LazyNode::touch(Clock::time_point now) -> void {
    this->touched.store(now.time_since_epoch().count(), std::memory_order_relaxed);
}

auto LazyNode::children() const -> Children {
    std::lock_guard<std::mutex> lock(this->childMutex);
    return this->children_;
}

auto LazyNode::loadedChildCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->childMutex);
    return this->children_.size();
}

auto LazyNode::childFor(PathSegment const& segment) const -> std::shared_ptr<LazyNode> {
    std::lock_guard<std::mutex> lock(this->childMutex);
    if (segment.isIndex()) {
        // Array children are attached in index order starting at 0.
        auto const index = segment.index();
        if (index < this->children_.size() && this->children_[index]->path().back() == segment)
            return this->children_[index];
        return nullptr;
    }
    for (auto const& child : this->children_) {
        if (child->path().back() == segment)
            return child;
    }
    return nullptr;
}

auto LazyNode::beginLoad() -> bool {
    if (!this->state_.tryBeginLoad())
        return false;
    std::lock_guard<std::mutex> lock(this->childMutex);
    this->children_.clear();
    this->appending = false;
    this->error_.reset();
    return true;
}

auto LazyNode::beginAppend() -> bool {
    if (!this->state_.tryBeginAppend())
        return false;
    std::lock_guard<std::mutex> lock(this->childMutex);
    this->appending = true;
    return true;
}

auto LazyNode::appendChildren(Children batch) -> void {
    std::lock_guard<std::mutex> lock(this->childMutex);
    if (this->children_.empty()) {
        this->children_ = std::move(batch);
        return;
    }
    this->children_.insert(this->children_.end(),
                           std::make_move_iterator(batch.begin()),
                           std::make_move_iterator(batch.end()));
}

auto LazyNode::completeLoad() -> void {
    std::lock_guard<std::mutex> lock(this->childMutex);
    this->appending = false;
    this->error_.reset();
    if (!this->state_.markLoaded())
        jl_log("LazyNode::completeLoad called outside a load: " + this->path_.toString(), "Loader", "Warning");
}

auto LazyNode::failLoad(Error error) -> void {
    std::lock_guard<std::mutex> lock(this->childMutex);
    this->error_ = std::move(error);
    if (this->appending) {
        // The pages attached before the failure stay valid.
        this->appending = false;
        this->state_.markLoaded();
        return;
    }
    this->children_.clear();
    this->state_.markFailed();
}

auto LazyNode::cancelLoad() -> void {
    std::lock_guard<std::mutex> lock(this->childMutex);
    if (this->appending) {
        this->appending = false;
        this->state_.markLoaded();
        return;
    }
    this->children_.clear();
    this->state_.markIdle();
}

auto LazyNode::tryEvict() -> std::optional<std::size_t> {
    Children dropped;
    {
        std::lock_guard<std::mutex> lock(this->childMutex);
        if (!this->state_.tryEvict())
            return std::nullopt;
        dropped.swap(this->children_);
    }
    std::size_t released = dropped.size();
    for (auto const& child : dropped)
        released += countMaterialized(*child);
    return released;
}

auto countMaterialized(LazyNode const& node) -> std::size_t {
    std::size_t count = 0;
    for (auto const& child : node.children()) {
        count += 1 + countMaterialized(*child);
    }
    return count;
}

} // namespace JL
