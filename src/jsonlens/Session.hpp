#pragma once
#include "analysis/StructureAnalyzer.hpp"
#include "core/CancellationToken.hpp"
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "document/Document.hpp"
#include "events/EventChannel.hpp"
#include "load/LoadCoordinator.hpp"
#include "memory/MemoryMonitor.hpp"
#include "memory/NodeCache.hpp"
#include "search/SearchEngine.hpp"
#include "task/TaskPool.hpp"
#include "tree/LazyNode.hpp"
#include "tree/TreeSerializer.hpp"

#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace JL {

/**
 * Session: one opened document and everything navigating it.
 *
 * Owns the immutable Document, the lazily materialized tree rooted at root(),
 * the load coordinator, the memory monitor, the search engine and the event
 * channel that reports their state changes. This is the surface a UI or CLI
 * shell talks to; the core never renders anything itself.
 *
 * collapse() only clears the expanded flag. Dropping the children is left to
 * the memory monitor, which evicts collapsed subtrees under pressure.
 */
class Session {
public:
    static auto open(std::filesystem::path const& file, Config config = {}, CancellationToken const& token = {})
            -> Expected<std::unique_ptr<Session>>;
    static auto openBytes(std::string_view bytes, Config config = {}, CancellationToken const& token = {}, std::string sourceName = "<memory>")
            -> Expected<std::unique_ptr<Session>>;
    // Wraps an already parsed document; sampler defaults to ProcessMemorySampler.
    static auto create(std::shared_ptr<Document const> document, Config config = {}, std::unique_ptr<MemorySampler> sampler = nullptr)
            -> Expected<std::unique_ptr<Session>>;

    ~Session();

    Session(Session const&)                    = delete;
    auto operator=(Session const&) -> Session& = delete;

    [[nodiscard]] auto document() const -> Document const& { return *this->document_; }
    [[nodiscard]] auto config() const -> Config const& { return this->config_; }

    // Structure statistics, computed once and cached.
    auto analyze(CancellationToken const& token = {}) -> Expected<StructureInfo>;
    auto analyzeAsync(CancellationToken const& token = {}) -> std::future<Expected<StructureInfo>>;

    [[nodiscard]] auto root() const -> std::shared_ptr<LazyNode> { return this->root_; }
    // Materialized node at path; NoSuchPath when it is not in the tree (yet).
    auto nodeAt(Path const& path) -> Expected<std::shared_ptr<LazyNode>>;

    auto expand(std::shared_ptr<LazyNode> const& node, ExpandRequest request = {}) -> LoadTicket;
    auto expandAndWait(std::shared_ptr<LazyNode> const& node, ExpandRequest request = {}) -> Expected<LoadOutcome>;
    auto loadMore(std::shared_ptr<LazyNode> const& node, std::optional<std::size_t> count = std::nullopt) -> LoadTicket;
    auto collapse(std::shared_ptr<LazyNode> const& node) -> void;

    // Selected node; it and its ancestors are never evicted.
    auto setFocus(std::optional<Path> path) -> void;
    [[nodiscard]] auto focus() const -> std::optional<Path>;

    auto rebuildIndex(CancellationToken const& token = {}) -> Expected<IndexStats>;
    auto search(std::string query, SearchOptions options = {}, CancellationToken const& token = {})
            -> std::future<Expected<std::vector<SearchResult>>>;
    auto searchNow(std::string_view query, SearchOptions const& options = {}, CancellationToken const& token = {})
            -> Expected<std::vector<SearchResult>>;

    [[nodiscard]] auto memoryStatus() const -> MemoryStatus;
    [[nodiscard]] auto memoryStatistics() const -> MemoryStatistics;
    [[nodiscard]] auto loaderStatus() const -> LoaderStatus;
    auto startMonitoring() -> bool;
    auto stopMonitoring() -> void;

    auto serialize(SerializeOptions const& options = {}) const -> std::string;
    auto save(std::filesystem::path const& file, SerializeOptions const& options = {}) const -> std::optional<Error>;

    auto events() -> EventChannel& { return this->events_; }
    auto loader() -> LoadCoordinator& { return *this->loader_; }
    auto monitor() -> MemoryMonitor& { return *this->monitor_; }
    auto searchEngine() -> SearchEngine& { return this->search_; }
    auto cache() -> NodeCache& { return this->cache_; }

private:
    Session(std::shared_ptr<Document const> document, Config config, std::unique_ptr<MemorySampler> sampler);

    template <typename T>
    auto runInBackground(std::function<Expected<T>()> work) -> std::future<Expected<T>>;

    Config                          config_;
    EventChannel                    events_;
    NodeCache                       cache_;
    std::shared_ptr<Document const> document_;
    std::shared_ptr<LazyNode>       root_;

    mutable std::mutex           stateMutex;
    std::optional<Path>          focus_;
    std::optional<StructureInfo> structure;

    SearchEngine                     search_;
    TaskPool                         background;
    std::unique_ptr<LoadCoordinator> loader_;
    std::unique_ptr<MemoryMonitor>   monitor_;
};

} // namespace JL
