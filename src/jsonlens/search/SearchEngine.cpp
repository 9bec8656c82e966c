#include "SearchEngine.hpp"
#include "log/TaggedLogger.hpp"
#include "search/GlobMatcher.hpp"

#include <algorithm>
#include <optional>

#include <re2/re2.h>

namespace JL {

namespace {

constexpr std::size_t ShortContextLength        = 50;
constexpr std::size_t CancellationCheckInterval = 64;

struct Match {
    SearchIndex::EntryId id;
    std::size_t          offset = 0;
    std::size_t          length = 0;
};

auto included(MatchKind kind, SearchOptions const& options) -> bool {
    switch (kind) {
        case MatchKind::Key:
            return options.keys;
        case MatchKind::Value:
            return options.values;
        case MatchKind::Path:
            return options.paths;
    }
    return false;
}

auto isContinuation(std::string_view text, std::size_t position) -> bool {
    return position < text.size() && (static_cast<unsigned char>(text[position]) & 0xC0u) == 0x80u;
}

// Collects matches while polling the token; returns the token's error when it fires.
class Collector {
public:
    Collector(SearchIndex const& index, SearchOptions const& options, CancellationToken const& token)
        : index(index), options(options), token(token), seen(index.entries().size(), false) {}

    auto poll() -> bool {
        if ((++this->steps % CancellationCheckInterval) != 0)
            return true;
        this->stopped = this->token.check();
        return !this->stopped;
    }

    // Dedups per entry and applies the category filter.
    auto offer(SearchIndex::EntryId id) -> IndexEntry const* {
        if (this->seen[id])
            return nullptr;
        this->seen[id] = true;
        auto const& entry = this->index.entries()[id];
        return included(entry.kind, this->options) ? &entry : nullptr;
    }

    auto accept(SearchIndex::EntryId id, std::size_t offset, std::size_t length) -> void {
        this->matches.push_back(Match{id, offset, length});
    }

    SearchIndex const&       index;
    SearchOptions const&     options;
    CancellationToken const& token;
    std::vector<bool>        seen;
    std::vector<Match>       matches;
    std::optional<Error>     stopped;
    std::size_t              steps = 0;
};

auto plainSearch(Collector& collector, std::string_view text) -> void {
    auto const& index         = collector.index;
    bool const  caseSensitive = collector.options.caseSensitive;
    auto const  folded        = foldCase(text);

    auto verify = [&](SearchIndex::EntryId id) {
        auto const* entry = collector.offer(id);
        if (entry == nullptr)
            return;
        auto const position = caseSensitive ? entry->content.find(text) : entry->folded.find(folded);
        if (position != std::string::npos)
            collector.accept(id, position, text.size());
    };

    // Distinct terms first: repeated keys such as "id" are tested once.
    for (auto const& [term, postings] : index.terms()) {
        if (!collector.poll())
            return;
        if (term.find(folded) == std::string::npos)
            continue;
        for (auto id : postings)
            verify(id);
    }

    auto const& longValues = folded.size() >= index.gramSize() ? index.gramCandidates(folded) : index.longValues();
    for (auto id : longValues) {
        if (!collector.poll())
            return;
        verify(id);
    }
}

auto wildcardSearch(Collector& collector, std::string_view pattern) -> void {
    auto const& index         = collector.index;
    bool const  caseSensitive = collector.options.caseSensitive;

    auto verify = [&](SearchIndex::EntryId id) {
        auto const* entry = collector.offer(id);
        if (entry != nullptr && globMatch(pattern, entry->content, caseSensitive))
            collector.accept(id, 0, entry->content.size());
    };

    for (auto const& [term, postings] : index.terms()) {
        if (!collector.poll())
            return;
        // Terms are folded, so a case-insensitive match is a necessary condition.
        if (!globMatch(pattern, term, false))
            continue;
        for (auto id : postings)
            verify(id);
    }
    for (auto id : index.longValues()) {
        if (!collector.poll())
            return;
        verify(id);
    }
}

// RE2 matches in time linear in the entry, so checking the token before every
// entry bounds the whole scan.
auto regexSearch(Collector& collector, RE2 const& pattern) -> void {
    auto const& entries = collector.index.entries();
    for (SearchIndex::EntryId id = 0; id < entries.size(); ++id) {
        if (auto error = collector.token.check()) {
            collector.stopped = std::move(error);
            return;
        }
        auto const* entry = collector.offer(id);
        if (entry == nullptr)
            continue;
        re2::StringPiece const content{entry->content};
        re2::StringPiece       match;
        if (pattern.Match(content, 0, content.size(), RE2::UNANCHORED, &match, 1))
            collector.accept(id, static_cast<std::size_t>(match.data() - content.data()), match.size());
    }
}

} // namespace

auto rankScore(MatchKind kind, bool exactMatch, std::size_t depth) -> double {
    double score = 0.0;
    switch (kind) {
        case MatchKind::Key:
            score += 3.0;
            break;
        case MatchKind::Value:
            score += 2.0;
            break;
        case MatchKind::Path:
            score += 1.0;
            break;
    }
    if (exactMatch)
        score += 2.0;
    if (depth < 5)
        score += static_cast<double>(5 - depth) * 0.1;
    return score;
}

auto matchContext(std::string_view content, std::size_t offset, std::size_t length, std::size_t radius) -> std::string {
    if (content.size() <= ShortContextLength || offset > content.size())
        return std::string{content};

    auto start = offset > radius ? offset - radius : 0;
    auto end   = std::min(content.size(), offset + length + radius);
    while (start > 0 && isContinuation(content, start))
        --start;
    while (end < content.size() && isContinuation(content, end))
        ++end;

    std::string context;
    if (start > 0)
        context += "...";
    context.append(content.substr(start, end - start));
    if (end < content.size())
        context += "...";
    return context;
}

SearchEngine::SearchEngine(SearchConfig config, EventChannel* events)
    : config_(std::move(config)), events(events) {}

auto SearchEngine::rebuild(std::shared_ptr<LazyNode> const& root, CancellationToken const& token) -> Expected<IndexStats> {
    auto built = SearchIndex::build(root, this->config_, token);
    if (!built)
        return std::unexpected(std::move(built.error()));
    auto const stats = (*built)->stats();
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->index = std::move(*built);
    }
    if (this->events != nullptr)
        this->events->publish(Event{.kind = EventKind::IndexRebuilt, .count = stats.entries});
    return stats;
}

auto SearchEngine::clear() -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->index.reset();
}

auto SearchEngine::snapshot() const -> std::shared_ptr<SearchIndex const> {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->index;
}

auto SearchEngine::stats() const -> IndexStats {
    auto const current = this->snapshot();
    return current ? current->stats() : IndexStats{};
}

auto SearchEngine::query(std::string_view text, SearchOptions const& options, CancellationToken const& token) const
        -> Expected<std::vector<SearchResult>> {
    std::vector<SearchResult> results;
    auto const                index = this->snapshot();
    if (!index || text.empty() || text.size() < this->config_.minQueryLength)
        return results;

    auto const timeout   = options.timeout.value_or(this->config_.timeout);
    auto const bounded   = token.withDeadline(CancellationToken::Clock::now() + timeout);
    auto const maxResults = options.maxResults.value_or(this->config_.maxResults);
    if (auto error = bounded.check())
        return std::unexpected(std::move(*error));

    Collector collector{*index, options, bounded};
    if (options.regex) {
        RE2::Options flags;
        flags.set_case_sensitive(options.caseSensitive);
        flags.set_log_errors(false);
        RE2 const pattern{re2::StringPiece{text.data(), text.size()}, flags};
        if (!pattern.ok()) {
            jl_log("SearchEngine::query invalid pattern: " + std::string{text}, "Search");
            return std::unexpected(Error{Error::Code::InvalidPattern, "invalid regular expression: " + pattern.error()});
        }
        regexSearch(collector, pattern);
    } else if (options.wildcard) {
        wildcardSearch(collector, text);
    } else {
        plainSearch(collector, text);
    }

    if (collector.stopped) {
        jl_log("SearchEngine::query stopped: " + describeError(*collector.stopped), "Search");
        return std::unexpected(std::move(*collector.stopped));
    }

    auto const foldedQuery = foldCase(text);
    results.reserve(collector.matches.size());
    for (auto const& match : collector.matches) {
        auto const& entry = index->entries()[match.id];
        SearchResult result;
        result.path        = entry.path;
        result.pathText    = entry.pathText;
        result.kind        = entry.kind;
        result.matched     = entry.content.substr(match.offset, match.length);
        result.matchOffset = match.offset;
        result.context     = matchContext(entry.content, match.offset, match.length, this->config_.contextRadius);
        result.score       = rankScore(entry.kind, entry.folded == foldedQuery, entry.path.depth());
        results.push_back(std::move(result));
    }

    std::stable_sort(results.begin(), results.end(), [](SearchResult const& lhs, SearchResult const& rhs) {
        if (lhs.score != rhs.score)
            return lhs.score > rhs.score;
        return lhs.path < rhs.path;
    });
    if (results.size() > maxResults)
        results.resize(maxResults);
    jl_log("SearchEngine::query '" + std::string{text} + "' -> " + std::to_string(results.size()) + " results", "Search");
    return results;
}

} // namespace JL
