#pragma once
#include "core/CancellationToken.hpp"
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "search/SearchTypes.hpp"
#include "tree/LazyNode.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace JL {

struct IndexEntry {
    Path        path;
    std::string pathText;
    MatchKind   kind = MatchKind::Key;
    std::string content; // as displayed: key label, leaf value text or path text
    std::string folded;  // lowercased content
    bool        longValue = false;
};

/**
 * Immutable inverted index over the materialized part of a tree.
 *
 * Every entry lives in exactly one lookup structure:
 * - terms: folded content -> entries, for keys, paths and short values
 * - grams: every gramSize-long substring of a long value -> entries
 *   (a value is long when it exceeds SearchConfig::ngramThreshold)
 *
 * A plain substring query scans the distinct terms and intersects the gram
 * postings of the query; candidates are then verified against the content.
 * Unloaded subtrees contribute nothing until loaded and the index is rebuilt.
 */
class SearchIndex {
public:
    using EntryId  = std::uint32_t;
    using Postings = std::vector<EntryId>;
    using TermMap  = phmap::flat_hash_map<std::string, Postings>;

    static auto build(std::shared_ptr<LazyNode> const& root,
                      SearchConfig const& config     = {},
                      CancellationToken const& token = {}) -> Expected<std::shared_ptr<SearchIndex const>>;

    [[nodiscard]] auto entries() const -> std::vector<IndexEntry> const& { return this->entries_; }
    [[nodiscard]] auto terms() const -> TermMap const& { return this->terms_; }
    [[nodiscard]] auto longValues() const -> Postings const& { return this->longValues_; }
    [[nodiscard]] auto gramSize() const -> std::size_t { return this->gramSize_; }
    [[nodiscard]] auto stats() const -> IndexStats const& { return this->stats_; }

    // Long values containing every gram of foldedQuery; requires foldedQuery.size() >= gramSize().
    [[nodiscard]] auto gramCandidates(std::string_view foldedQuery) const -> Postings;

private:
    SearchIndex() = default;

    auto add(IndexEntry entry, std::size_t ngramThreshold) -> void;

    std::vector<IndexEntry> entries_;
    TermMap                 terms_;
    TermMap                 grams_;
    Postings                longValues_;
    std::size_t             gramSize_ = 3;
    IndexStats              stats_;
};

// ASCII lowercase; other bytes unchanged.
auto foldCase(std::string_view text) -> std::string;

// Leaf value as searchable text: raw string contents, JSON text for other scalars.
auto valueText(LazyNode const& node) -> std::string;

} // namespace JL
