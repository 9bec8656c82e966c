#pragma once
#include "core/Error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>

#include <nlohmann/json_fwd.hpp>

namespace JL {

inline constexpr std::uint64_t MiB = 1024ull * 1024ull;

struct ParseConfig {
    std::size_t   maxDepth      = 100;
    std::uint64_t maxBytes      = 500 * MiB;
    bool          allowComments = true;
};

struct LoaderConfig {
    std::size_t               maxConcurrentLoads = 3;
    std::size_t               childLimit         = 1000;
    std::size_t               batchSize          = 500;
    std::chrono::milliseconds loadTimeout{10'000};
    std::size_t               previewLength    = 100;
    std::size_t               preloadCount     = 5;
    bool                      expandRootOnOpen = true;
};

struct MonitorConfig {
    bool                      autoStart = true;
    std::chrono::milliseconds interval{2'000};
    std::uint64_t             warningBytes  = 300 * MiB;
    std::uint64_t             criticalBytes = 500 * MiB;
    std::uint32_t             aggressiveAfter = 3;
    std::chrono::milliseconds aggressiveCooldown{60'000};
    // Regular cleanup spares nodes collapsed more recently than this.
    std::chrono::milliseconds regularIdleGrace{2'000};
    // Expired cache entries are purged at least this often, whatever the level.
    std::chrono::milliseconds cachePurgeInterval{120'000};
    std::size_t               cacheCapacity     = 100'000;
    std::size_t               optimizeMinDepth  = 3;
};

struct SearchConfig {
    std::size_t               maxResults     = 1000;
    std::chrono::milliseconds timeout{5'000};
    std::size_t               ngramThreshold = 10;
    std::size_t               gramSize       = 3;
    std::size_t               contextRadius  = 20;
    std::size_t               minQueryLength = 1;
};

struct Config {
    ParseConfig   parse;
    LoaderConfig  loader;
    MonitorConfig monitor;
    SearchConfig  search;
    std::size_t   backgroundThreads = 2;
};

// Cross-field checks (thresholds ordered, non-zero pool sizes and batch sizes).
auto validateConfig(Config const& config) -> std::optional<Error>;

// Keys mirror the struct layout: {"parse": {"maxDepth": 100}, "monitor": {"warningMB": 300}, ...}.
auto configFromJson(nlohmann::ordered_json const& json) -> Expected<Config>;
auto configToJson(Config const& config) -> nlohmann::ordered_json;
auto loadConfig(std::filesystem::path const& file) -> Expected<Config>;

// Overrides selected fields from JSONLENS_* environment variables.
auto applyEnvironment(Config& config) -> void;

} // namespace JL
