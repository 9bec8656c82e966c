#pragma once
#include <atomic>
#include <string_view>

namespace JL {

// Load lifecycle of a LazyNode's children
enum class LoadState {
    Idle,    // Children not materialized (initial state, or after eviction/cancellation)
    Loading, // A materialization pass owns the node
    Loaded,  // Children attached
    Failed   // Last materialization failed; retryable
};

constexpr std::string_view loadStateToString(LoadState state) {
    switch (state) {
        case LoadState::Idle:
            return "Idle";
        case LoadState::Loading:
            return "Loading";
        case LoadState::Loaded:
            return "Loaded";
        case LoadState::Failed:
            return "Failed";
    }
    return "Unknown";
}

// Thread-safe wrapper for per-node load state transitions.
// Every transition is a single compare-exchange, so at most one loader or evictor wins.
struct NodeStateAtomic {
    NodeStateAtomic() = default;                              // Starts Idle
    NodeStateAtomic(const NodeStateAtomic& other);            // Snapshot of the other state
    NodeStateAtomic& operator=(const NodeStateAtomic& other); // Snapshot of the other state

    NodeStateAtomic(NodeStateAtomic&& other)            = delete;
    NodeStateAtomic& operator=(NodeStateAtomic&& other) = delete;

    bool tryBeginLoad();    // Idle or Failed -> Loading
    bool tryBeginAppend();  // Loaded -> Loading, for appending another page
    bool markLoaded();      // Loading -> Loaded
    bool markFailed();      // Loading -> Failed
    bool markIdle();        // Loading -> Idle (cancelled first load)
    bool tryEvict();        // Loaded -> Idle
    bool isLoaded() const;  // Check if children are attached
    bool isLoading() const; // Check if a materialization pass owns the node
    bool isFailed() const;  // Check if the last pass failed

    LoadState get() const; // Current state with acquire semantics

    std::string_view toString() const;

private:
    bool transition(LoadState from, LoadState to);

    std::atomic<LoadState> state{LoadState::Idle};
};

} // namespace JL
