#include "PressurePolicy.hpp"

namespace JL {

auto classifyMemory(std::uint64_t residentBytes, MonitorConfig const& config) -> MemoryLevel {
    if (residentBytes > config.criticalBytes)
        return MemoryLevel::Critical;
    if (residentBytes > config.warningBytes)
        return MemoryLevel::Warning;
    return MemoryLevel::Normal;
}

auto evaluatePressure(PressureState const& state, MemorySample const& sample, MonitorConfig const& config) -> PressureDecision {
    PressureDecision decision;
    decision.next         = state;
    decision.level        = classifyMemory(sample.residentBytes, config);
    decision.levelChanged = decision.level != state.level;
    decision.next.level   = decision.level;

    switch (decision.level) {
        case MemoryLevel::Normal:
            decision.next.consecutiveWarnings = 0;
            break;
        case MemoryLevel::Warning: {
            ++decision.next.consecutiveWarnings;
            bool const cooledDown = !state.lastAggressive || sample.time - *state.lastAggressive >= config.aggressiveCooldown;
            if (decision.next.consecutiveWarnings >= config.aggressiveAfter && cooledDown) {
                decision.cleanup             = CleanupKind::Aggressive;
                decision.purgeCache          = true;
                decision.requestReclaim      = true;
                decision.next.lastAggressive = sample.time;
            } else {
                decision.cleanup = CleanupKind::Regular;
            }
            break;
        }
        case MemoryLevel::Critical:
            ++decision.next.consecutiveWarnings;
            decision.cleanup        = CleanupKind::Emergency;
            decision.requestReclaim = true;
            break;
    }

    if (!state.lastCachePurge) {
        decision.next.lastCachePurge = sample.time;
    } else if (sample.time - *state.lastCachePurge >= config.cachePurgeInterval) {
        decision.purgeCache = true;
    }
    if (decision.purgeCache)
        decision.next.lastCachePurge = sample.time;
    return decision;
}

} // namespace JL
