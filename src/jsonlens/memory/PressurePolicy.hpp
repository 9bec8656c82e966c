#pragma once
#include "core/Config.hpp"
#include "memory/MemoryLevel.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace JL {

enum class CleanupKind {
    None,
    Regular,    // evict collapsed nodes idle for at least regularIdleGrace
    Aggressive, // evict every collapsed node, purge expired cache entries
    Emergency   // evict every collapsed node, clear the cache
};

constexpr std::string_view cleanupKindToString(CleanupKind kind) {
    switch (kind) {
        case CleanupKind::None:
            return "None";
        case CleanupKind::Regular:
            return "Regular";
        case CleanupKind::Aggressive:
            return "Aggressive";
        case CleanupKind::Emergency:
            return "Emergency";
    }
    return "Unknown";
}

struct MemorySample {
    std::uint64_t                         residentBytes = 0;
    std::chrono::steady_clock::time_point time;
};

// Carried from one sample to the next.
struct PressureState {
    MemoryLevel                                          level               = MemoryLevel::Normal;
    std::uint32_t                                        consecutiveWarnings = 0;
    std::optional<std::chrono::steady_clock::time_point> lastAggressive;
    std::optional<std::chrono::steady_clock::time_point> lastCachePurge;
};

struct PressureDecision {
    PressureState next;
    MemoryLevel   level          = MemoryLevel::Normal;
    bool          levelChanged   = false;
    CleanupKind   cleanup        = CleanupKind::None;
    bool          purgeCache     = false; // drop expired cache entries
    bool          requestReclaim = false; // ask the host to return free memory to the OS
};

[[nodiscard]] auto classifyMemory(std::uint64_t residentBytes, MonitorConfig const& config) -> MemoryLevel;

/**
 * One monitoring step as a pure function of (previous state, sample).
 *
 * - Normal resets the consecutive warning count and takes no action.
 * - Warning and Critical both count as a warning sample.
 * - Warning runs a regular cleanup, escalated to an aggressive one once
 *   aggressiveAfter warnings in a row were seen and the previous aggressive
 *   cleanup is older than aggressiveCooldown.
 * - Critical runs an emergency cleanup and requests reclaim.
 * - Independently of the level, the cache is purged once cachePurgeInterval
 *   has elapsed since the previous purge.
 */
[[nodiscard]] auto evaluatePressure(PressureState const& state, MemorySample const& sample, MonitorConfig const& config) -> PressureDecision;

} // namespace JL
