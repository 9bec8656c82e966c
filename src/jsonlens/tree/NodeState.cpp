#include "NodeState.hpp"

namespace JL {

NodeStateAtomic::NodeStateAtomic(const NodeStateAtomic& other) : state(other.state.load(std::memory_order_acquire)) {}

NodeStateAtomic& NodeStateAtomic::operator=(const NodeStateAtomic& other) {
    state.store(other.state.load(std::memory_order_acquire), std::memory_order_release);
    return *this;
}

bool NodeStateAtomic::transition(LoadState from, LoadState to) {
    return state.compare_exchange_strong(from, to, std::memory_order_acq_rel);
}

bool NodeStateAtomic::tryBeginLoad() {
    return transition(LoadState::Idle, LoadState::Loading) || transition(LoadState::Failed, LoadState::Loading);
}

bool NodeStateAtomic::tryBeginAppend() {
    return transition(LoadState::Loaded, LoadState::Loading);
}

bool NodeStateAtomic::markLoaded() {
    return transition(LoadState::Loading, LoadState::Loaded);
}

bool NodeStateAtomic::markFailed() {
    return transition(LoadState::Loading, LoadState::Failed);
}

bool NodeStateAtomic::markIdle() {
    return transition(LoadState::Loading, LoadState::Idle);
}

bool NodeStateAtomic::tryEvict() {
    return transition(LoadState::Loaded, LoadState::Idle);
}

LoadState NodeStateAtomic::get() const {
    return state.load(std::memory_order_acquire);
}

bool NodeStateAtomic::isLoaded() const {
    return get() == LoadState::Loaded;
}

bool NodeStateAtomic::isLoading() const {
    return get() == LoadState::Loading;
}

bool NodeStateAtomic::isFailed() const {
    return get() == LoadState::Failed;
}

std::string_view NodeStateAtomic::toString() const {
    return loadStateToString(get());
}

} // namespace JL
