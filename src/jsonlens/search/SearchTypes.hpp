#pragma once
#include "path/Path.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace JL {

enum class MatchKind {
    Key,
    Value,
    Path
};

constexpr std::string_view matchKindToString(MatchKind kind) {
    switch (kind) {
        case MatchKind::Key:
            return "key";
        case MatchKind::Value:
            return "value";
        case MatchKind::Path:
            return "path";
    }
    return "unknown";
}

struct SearchOptions {
    bool caseSensitive = false;
    bool regex         = false;
    bool wildcard      = false; // ignored when regex is set
    bool keys          = true;
    bool values        = true;
    bool paths         = false;
    // Overrides SearchConfig::maxResults / SearchConfig::timeout for one query.
    std::optional<std::size_t>               maxResults;
    std::optional<std::chrono::milliseconds> timeout;
};

struct SearchResult {
    Path        path;
    std::string pathText;
    MatchKind   kind = MatchKind::Key;
    std::string matched;         // the matched substring of the indexed content
    std::size_t matchOffset = 0; // byte offset of matched within the content
    std::string context;         // content around the match, "..." where cut
    double      score = 0.0;
};

struct IndexStats {
    std::size_t   nodes          = 0; // materialized nodes visited
    std::size_t   entries        = 0; // key, value and path entries
    std::size_t   buckets        = 0; // distinct normalized terms
    std::size_t   grams          = 0; // distinct n-grams
    std::size_t   longValues     = 0; // values indexed by n-grams
    std::size_t   estimatedBytes = 0;
};

} // namespace JL
