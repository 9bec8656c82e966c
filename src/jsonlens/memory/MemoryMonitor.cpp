#include "MemoryMonitor.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace JL {

MemoryMonitor::MemoryMonitor(MonitorConfig config,
                             std::unique_ptr<MemorySampler> sampler,
                             NodeCache& cache,
                             EventChannel* events,
                             RootProvider root,
                             FocusProvider focus,
                             ReclaimHook reclaim)
    : config(std::move(config)),
      sampler(std::move(sampler)),
      cache(cache),
      events(events),
      root(std::move(root)),
      focus(std::move(focus)),
      reclaim(std::move(reclaim)) {}

MemoryMonitor::~MemoryMonitor() {
    this->stop();
}

auto MemoryMonitor::start() -> bool {
    std::lock_guard<std::mutex> lock(this->threadMutex);
    if (this->worker.joinable())
        return false;
    this->worker = std::jthread([this](std::stop_token stopToken) { this->run(stopToken); });
    jl_log("MemoryMonitor started, interval=" + std::to_string(this->config.interval.count()) + "ms", "Memory");
    return true;
}

auto MemoryMonitor::stop() -> void {
    std::jthread stopping;
    {
        std::lock_guard<std::mutex> lock(this->threadMutex);
        if (!this->worker.joinable())
            return;
        stopping = std::move(this->worker);
    }
    stopping.request_stop();
    this->wakeup.notify_all();
    stopping.join();
    jl_log("MemoryMonitor stopped", "Memory");
}

auto MemoryMonitor::isRunning() const -> bool {
    std::lock_guard<std::mutex> lock(this->threadMutex);
    return this->worker.joinable();
}

auto MemoryMonitor::run(std::stop_token stopToken) -> void {
#ifdef JL_LOG_DEBUG
    set_thread_name("MemoryMonitor");
#endif
    std::mutex waitMutex;
    while (!stopToken.stop_requested()) {
        this->tick();
        std::unique_lock<std::mutex> lock(waitMutex);
        this->wakeup.wait_for(lock, stopToken, this->config.interval, [] { return false; });
    }
}

auto MemoryMonitor::tick(Clock::time_point now) -> std::optional<PressureDecision> {
    std::vector<Event> pending;
    PressureDecision   decision;
    {
        std::lock_guard<std::mutex> lock(this->tickMutex);
        auto resident = this->sampler->residentBytes();
        if (!resident) {
            ++this->stats.failedSamples;
            jl_log("MemoryMonitor: sampling failed, skipping cycle: " + describeError(resident.error()), "Memory", "Warning");
            return std::nullopt;
        }

        ++this->stats.samples;
        this->stats.peakResidentBytes = std::max(this->stats.peakResidentBytes, *resident);
        decision       = evaluatePressure(this->pressure, MemorySample{*resident, now}, this->config);
        this->pressure = decision.next;

        if (decision.levelChanged)
            jl_log("MemoryMonitor: level " + std::string{memoryLevelToString(decision.level)} + " at "
                           + std::to_string(*resident / MiB) + " MiB",
                   "Memory", decision.level == MemoryLevel::Normal ? "Info" : "Warning");

        if (decision.cleanup != CleanupKind::None)
            this->record(this->cleanup(decision.cleanup, now), pending);
        if (decision.cleanup == CleanupKind::Emergency) {
            this->cache.clear();
        } else if (decision.purgeCache) {
            this->stats.cacheEntriesPurged += this->cache.purgeExpired();
        }
        if (decision.requestReclaim && this->reclaim) {
            ++this->stats.reclaimRequests;
            this->reclaim();
        }

        this->lastStatus = MemoryStatus{decision.level, *resident, this->cache.size(), this->cache.hitRate()};
        pending.push_back(Event{.kind = EventKind::MemoryStatus, .count = this->lastStatus.cacheSize, .level = decision.level, .residentBytes = *resident});
        if (decision.levelChanged)
            pending.push_back(Event{.kind = EventKind::MemoryLevelChanged, .level = decision.level, .residentBytes = *resident});
    }
    this->publish(pending);
    return decision;
}

auto MemoryMonitor::cleanup(CleanupKind kind, Clock::time_point now) -> SweepResult {
    switch (kind) {
        case CleanupKind::Regular:
            ++this->stats.regularCleanups;
            break;
        case CleanupKind::Aggressive:
            ++this->stats.aggressiveCleanups;
            break;
        case CleanupKind::Emergency:
            ++this->stats.emergencyCleanups;
            break;
        case CleanupKind::None:
            return {};
    }
    auto const root = this->root ? this->root() : nullptr;
    if (!root)
        return {};
    SweepPolicy policy{.kind = kind, .now = now, .idleGrace = this->config.regularIdleGrace};
    if (this->focus)
        policy.focus = this->focus();
    return this->evictor.sweep(root, policy);
}

auto MemoryMonitor::status() const -> MemoryStatus {
    std::lock_guard<std::mutex> lock(this->tickMutex);
    auto status         = this->lastStatus;
    status.cacheSize    = this->cache.size();
    status.cacheHitRate = this->cache.hitRate();
    return status;
}

auto MemoryMonitor::statistics() const -> MemoryStatistics {
    std::lock_guard<std::mutex> lock(this->tickMutex);
    auto stats         = this->stats;
    stats.cacheHitRate = this->cache.hitRate();
    return stats;
}

auto MemoryMonitor::optimizeTree(std::optional<std::size_t> minDepth) -> SweepResult {
    std::vector<Event> pending;
    SweepResult        swept;
    {
        std::lock_guard<std::mutex> lock(this->tickMutex);
        auto const root = this->root ? this->root() : nullptr;
        if (!root)
            return {};
        SweepPolicy policy{.kind = CleanupKind::Aggressive, .minDepth = minDepth.value_or(this->config.optimizeMinDepth)};
        if (this->focus)
            policy.focus = this->focus();
        swept = this->evictor.sweep(root, policy);
        this->record(swept, pending);
    }
    jl_log("MemoryMonitor::optimizeTree released " + std::to_string(swept.nodesReleased) + " nodes", "Memory");
    this->publish(pending);
    return swept;
}

auto MemoryMonitor::emergencyCleanup() -> SweepResult {
    std::vector<Event> pending;
    SweepResult        swept;
    {
        std::lock_guard<std::mutex> lock(this->tickMutex);
        swept = this->cleanup(CleanupKind::Emergency, Clock::now());
        this->record(swept, pending);
        this->cache.clear();
        if (this->reclaim) {
            ++this->stats.reclaimRequests;
            this->reclaim();
        }
    }
    this->publish(pending);
    return swept;
}

auto MemoryMonitor::record(SweepResult const& swept, std::vector<Event>& pending) -> void {
    this->stats.nodesEvicted += swept.nodesEvicted;
    this->stats.nodesReleased += swept.nodesReleased;
    if (swept.evicted.empty())
        return;
    std::vector<Path> roots;
    roots.reserve(swept.evicted.size());
    for (auto const& evicted : swept.evicted) {
        roots.push_back(evicted.path);
        pending.push_back(Event{.kind = EventKind::NodeEvicted, .path = evicted.path, .count = evicted.released});
    }
    this->cache.removeDescendants(roots);
}

auto MemoryMonitor::publish(std::vector<Event> const& pending) -> void {
    if (this->events == nullptr)
        return;
    for (auto const& event : pending)
        this->events->publish(event);
}

} // namespace JL
