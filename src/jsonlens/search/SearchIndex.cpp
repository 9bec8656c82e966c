#include "SearchIndex.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace JL {

namespace {

constexpr std::size_t CancellationCheckInterval = 1024;

} // namespace

auto foldCase(std::string_view text) -> std::string {
    std::string folded{text};
    std::transform(folded.begin(), folded.end(), folded.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return folded;
}

auto valueText(LazyNode const& node) -> std::string {
    auto const& scalar = node.scalar();
    if (scalar.is_string())
        return scalar.get<std::string>();
    return scalar.dump();
}

auto SearchIndex::build(std::shared_ptr<LazyNode> const& root, SearchConfig const& config, CancellationToken const& token)
        -> Expected<std::shared_ptr<SearchIndex const>> {
    auto index       = std::shared_ptr<SearchIndex>(new SearchIndex{});
    index->gramSize_ = std::max<std::size_t>(config.gramSize, 1);
    if (!root)
        return std::shared_ptr<SearchIndex const>(std::move(index));

    jl_log("SearchIndex::build start", "Search");
    std::vector<std::shared_ptr<LazyNode>> pending{root};
    while (!pending.empty()) {
        auto node = std::move(pending.back());
        pending.pop_back();

        if ((++index->stats_.nodes % CancellationCheckInterval) == 0) {
            if (auto error = token.check()) {
                jl_log("SearchIndex::build stopped: " + describeError(*error), "Search");
                return std::unexpected(std::move(*error));
            }
        }

        auto const& path     = node->path();
        auto const  pathText = path.toString();
        if (!path.isRoot())
            index->add(IndexEntry{.path = path, .pathText = pathText, .kind = MatchKind::Key, .content = node->key()}, config.ngramThreshold);
        if (!node->isContainer())
            index->add(IndexEntry{.path = path, .pathText = pathText, .kind = MatchKind::Value, .content = valueText(*node)}, config.ngramThreshold);
        index->add(IndexEntry{.path = path, .pathText = pathText, .kind = MatchKind::Path, .content = pathText}, config.ngramThreshold);

        auto children = node->children();
        // Reverse so siblings are indexed in source order.
        for (auto it = children.rbegin(); it != children.rend(); ++it)
            pending.push_back(std::move(*it));
    }

    index->stats_.entries    = index->entries_.size();
    index->stats_.buckets    = index->terms_.size();
    index->stats_.grams      = index->grams_.size();
    index->stats_.longValues = index->longValues_.size();
    std::size_t bytes        = index->entries_.size() * sizeof(IndexEntry);
    for (auto const& entry : index->entries_)
        bytes += entry.content.size() * 2 + entry.pathText.size();
    for (auto const& [term, postings] : index->terms_)
        bytes += term.size() + postings.size() * sizeof(EntryId);
    for (auto const& [gram, postings] : index->grams_)
        bytes += gram.size() + postings.size() * sizeof(EntryId);
    index->stats_.estimatedBytes = bytes;

    jl_log("SearchIndex::build done: entries=" + std::to_string(index->stats_.entries) + " terms=" + std::to_string(index->stats_.buckets)
                   + " grams=" + std::to_string(index->stats_.grams),
           "Search");
    return std::shared_ptr<SearchIndex const>(std::move(index));
}

auto SearchIndex::add(IndexEntry entry, std::size_t ngramThreshold) -> void {
    if (entry.content.empty() && entry.kind != MatchKind::Value)
        return;
    auto const id   = static_cast<EntryId>(this->entries_.size());
    entry.folded    = foldCase(entry.content);
    entry.longValue = entry.kind == MatchKind::Value && entry.folded.size() > ngramThreshold && entry.folded.size() >= this->gramSize_;

    if (entry.longValue) {
        this->longValues_.push_back(id);
        for (std::size_t i = 0; i + this->gramSize_ <= entry.folded.size(); ++i) {
            auto& postings = this->grams_[entry.folded.substr(i, this->gramSize_)];
            if (postings.empty() || postings.back() != id)
                postings.push_back(id);
        }
    } else {
        this->terms_[entry.folded].push_back(id);
    }
    this->entries_.push_back(std::move(entry));
}

auto SearchIndex::gramCandidates(std::string_view foldedQuery) const -> Postings {
    if (foldedQuery.size() < this->gramSize_)
        return {};

    // Start from the rarest gram so intersections stay small.
    std::vector<Postings const*> lists;
    for (std::size_t i = 0; i + this->gramSize_ <= foldedQuery.size(); ++i) {
        auto it = this->grams_.find(std::string{foldedQuery.substr(i, this->gramSize_)});
        if (it == this->grams_.end())
            return {};
        lists.push_back(&it->second);
    }
    std::sort(lists.begin(), lists.end(), [](auto const* lhs, auto const* rhs) { return lhs->size() < rhs->size(); });

    // Posting lists are sorted by construction (ids only grow).
    Postings result = *lists.front();
    for (std::size_t i = 1; i < lists.size() && !result.empty(); ++i) {
        Postings next;
        std::set_intersection(result.begin(), result.end(), lists[i]->begin(), lists[i]->end(), std::back_inserter(next));
        result = std::move(next);
    }
    return result;
}

} // namespace JL
