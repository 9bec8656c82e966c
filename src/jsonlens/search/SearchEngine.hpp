#pragma once
#include "core/CancellationToken.hpp"
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "events/EventChannel.hpp"
#include "search/SearchIndex.hpp"
#include "search/SearchTypes.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace JL {

/**
 * SearchEngine: ranked queries over the current SearchIndex snapshot
 *
 * rebuild() builds a new index off to the side and swaps it in; a query takes
 * the snapshot once at its start and runs against it to completion, so it never
 * observes a half-built index. The engine does not follow tree changes: callers
 * rebuild after significant load or eviction activity.
 *
 * Modes:
 * - plain: substring containment, case-insensitive unless requested
 * - wildcard: whole-content glob ('*', '?', '[...]')
 * - regex: RE2 syntax, linear-time matching; a bad pattern is InvalidPattern
 *
 * Every query is bounded by SearchConfig::timeout (Timeout) and honours the
 * caller's token (Cancelled).
 */
class SearchEngine {
public:
    explicit SearchEngine(SearchConfig config = {}, EventChannel* events = nullptr);

    auto rebuild(std::shared_ptr<LazyNode> const& root, CancellationToken const& token = {}) -> Expected<IndexStats>;
    auto clear() -> void;

    [[nodiscard]] auto snapshot() const -> std::shared_ptr<SearchIndex const>;
    [[nodiscard]] auto stats() const -> IndexStats;
    [[nodiscard]] auto config() const -> SearchConfig const& { return this->config_; }

    auto query(std::string_view text, SearchOptions const& options = {}, CancellationToken const& token = {}) const
            -> Expected<std::vector<SearchResult>>;

private:
    SearchConfig                       config_;
    EventChannel*                      events;
    mutable std::mutex                 mutex;
    std::shared_ptr<SearchIndex const> index;
};

// Relevance: kind weight (key 3, value 2, path 1), +2 for an exact match, +0.1 per level above depth 5.
auto rankScore(MatchKind kind, bool exactMatch, std::size_t depth) -> double;

// Content around [offset, offset + length) with `radius` bytes either side and "..." where cut.
// Content of at most 50 bytes is returned whole.
auto matchContext(std::string_view content, std::size_t offset, std::size_t length, std::size_t radius) -> std::string;

} // namespace JL
