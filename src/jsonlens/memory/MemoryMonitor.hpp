#pragma once
#include "core/Config.hpp"
#include "events/EventChannel.hpp"
#include "memory/MemoryLevel.hpp"
#include "memory/MemorySampler.hpp"
#include "memory/NodeCache.hpp"
#include "memory/PressurePolicy.hpp"
#include "memory/TreeEvictor.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace JL {

struct MemoryStatus {
    MemoryLevel   level         = MemoryLevel::Normal;
    std::uint64_t residentBytes = 0;
    std::size_t   cacheSize     = 0;
    double        cacheHitRate  = 0.0;
};

struct MemoryStatistics {
    std::uint64_t samples            = 0;
    std::uint64_t failedSamples      = 0;
    std::uint64_t regularCleanups    = 0;
    std::uint64_t aggressiveCleanups = 0;
    std::uint64_t emergencyCleanups  = 0;
    std::uint64_t reclaimRequests    = 0;
    std::uint64_t nodesEvicted       = 0;
    std::uint64_t nodesReleased      = 0;
    std::uint64_t cacheEntriesPurged = 0;
    std::uint64_t peakResidentBytes  = 0;
    double        cacheHitRate       = 0.0;
};

/**
 * MemoryMonitor: periodic sample -> evaluate -> evict loop
 *
 * Every cycle (tick) samples resident memory, feeds it through
 * evaluatePressure(), applies the decided cleanup to the tree, purges the node
 * cache when asked, requests reclaim, and publishes a MemoryStatus event (plus
 * MemoryLevelChanged when the level moved).
 *
 * tick() is the whole cycle and can be driven directly with an explicit clock
 * value; start() merely runs it on a background thread every `interval`.
 * Sampling failures are logged and the cycle is skipped; they never propagate.
 *
 * Events are collected under tickMutex and published after it is released, so
 * a listener may call status() or statistics() from inside the callback.
 */
class MemoryMonitor {
public:
    using Clock         = std::chrono::steady_clock;
    using RootProvider  = std::function<std::shared_ptr<LazyNode>()>;
    using FocusProvider = std::function<std::optional<Path>()>;
    using ReclaimHook   = std::function<void()>;

    MemoryMonitor(MonitorConfig config,
                  std::unique_ptr<MemorySampler> sampler,
                  NodeCache& cache,
                  EventChannel* events,
                  RootProvider root,
                  FocusProvider focus = {},
                  ReclaimHook reclaim = releaseFreeMemory);
    ~MemoryMonitor();

    MemoryMonitor(MemoryMonitor const&)                    = delete;
    auto operator=(MemoryMonitor const&) -> MemoryMonitor& = delete;

    // Returns false when already running.
    auto start() -> bool;
    auto stop() -> void;
    [[nodiscard]] auto isRunning() const -> bool;

    // One monitoring cycle; nullopt when sampling failed.
    auto tick(Clock::time_point now = Clock::now()) -> std::optional<PressureDecision>;

    [[nodiscard]] auto status() const -> MemoryStatus;
    [[nodiscard]] auto statistics() const -> MemoryStatistics;

    // Evicts collapsed nodes deeper than minDepth (default: optimizeMinDepth), regardless of pressure.
    auto optimizeTree(std::optional<std::size_t> minDepth = std::nullopt) -> SweepResult;
    // Manual emergency cleanup: evict every collapsed node, clear the cache, reclaim.
    auto emergencyCleanup() -> SweepResult;

private:
    auto cleanup(CleanupKind kind, Clock::time_point now) -> SweepResult;
    // Caller holds tickMutex. Counts the sweep, drops stale cache entries and queues NodeEvicted events.
    auto record(SweepResult const& swept, std::vector<Event>& pending) -> void;
    auto publish(std::vector<Event> const& pending) -> void;
    auto run(std::stop_token stopToken) -> void;

    MonitorConfig                  config;
    std::unique_ptr<MemorySampler> sampler;
    NodeCache&                     cache;
    EventChannel*                  events;
    RootProvider                   root;
    FocusProvider                  focus;
    ReclaimHook                    reclaim;
    TreeEvictor                    evictor;

    mutable std::mutex tickMutex; // serializes cycles and guards the fields below
    PressureState      pressure;
    MemoryStatus       lastStatus;
    MemoryStatistics   stats;

    mutable std::mutex          threadMutex;
    std::condition_variable_any wakeup;
    std::jthread                worker;
};

} // namespace JL
