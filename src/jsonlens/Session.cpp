#include "Session.hpp"
#include "log/TaggedLogger.hpp"
#include "tree/TreeMaterializer.hpp"

#include <exception>
#include <fstream>

namespace JL {

auto Session::open(std::filesystem::path const& file, Config config, CancellationToken const& token) -> Expected<std::unique_ptr<Session>> {
    if (auto invalid = validateConfig(config))
        return std::unexpected(std::move(*invalid));
    auto document = Document::load(file, config.parse, token);
    if (!document) {
        jl_log("Session::open failed for " + file.string() + ": " + describeError(document.error()), "Session", "Error");
        return std::unexpected(std::move(document.error()));
    }
    return create(std::move(*document), std::move(config));
}

auto Session::openBytes(std::string_view bytes, Config config, CancellationToken const& token, std::string sourceName)
        -> Expected<std::unique_ptr<Session>> {
    if (auto invalid = validateConfig(config))
        return std::unexpected(std::move(*invalid));
    auto document = Document::parse(bytes, config.parse, token, std::move(sourceName));
    if (!document)
        return std::unexpected(std::move(document.error()));
    return create(std::move(*document), std::move(config));
}

auto Session::create(std::shared_ptr<Document const> document, Config config, std::unique_ptr<MemorySampler> sampler)
        -> Expected<std::unique_ptr<Session>> {
    if (!document)
        return std::unexpected(Error{Error::Code::UnknownError, "no document"});
    if (auto invalid = validateConfig(config))
        return std::unexpected(std::move(*invalid));
    if (!sampler)
        sampler = std::make_unique<ProcessMemorySampler>();

    auto session = std::unique_ptr<Session>(new Session(std::move(document), std::move(config), std::move(sampler)));
    if (session->config_.loader.expandRootOnOpen)
        session->expand(session->root_);
    if (session->config_.monitor.autoStart)
        session->startMonitoring();
    jl_log("Session opened: " + session->document_->sourceName(), "Session");
    return session;
}

Session::Session(std::shared_ptr<Document const> document, Config config, std::unique_ptr<MemorySampler> sampler)
    : config_(std::move(config)),
      cache_(this->config_.monitor.cacheCapacity),
      document_(std::move(document)),
      root_(makeRootNode(*this->document_, this->config_.loader.previewLength)),
      search_(this->config_.search, &this->events_),
      background(this->config_.backgroundThreads, "Background") {
    this->cache_.put(this->root_);
    this->loader_  = std::make_unique<LoadCoordinator>(this->document_, this->config_.loader, &this->events_);
    this->monitor_ = std::make_unique<MemoryMonitor>(
            this->config_.monitor,
            std::move(sampler),
            this->cache_,
            &this->events_,
            [this] { return this->root_; },
            [this] { return this->focus(); });
}

Session::~Session() {
    this->monitor_->stop();
    this->loader_->shutdown();
    this->background.shutdown();
    jl_log("Session closed", "Session");
}

template <typename T>
auto Session::runInBackground(std::function<Expected<T>()> work) -> std::future<Expected<T>> {
    auto promise = std::make_shared<std::promise<Expected<T>>>();
    auto future  = promise->get_future();
    auto task    = Task::Create(
            [promise, work = std::move(work)] {
                try {
                    promise->set_value(work());
                } catch (std::exception const& error) {
                    promise->set_value(std::unexpected(Error{Error::Code::UnknownError, error.what()}));
                }
            },
            "background",
            [promise](Error error) { promise->set_value(std::unexpected(std::move(error))); });
    if (auto error = this->background.submit(task))
        promise->set_value(std::unexpected(std::move(*error)));
    return future;
}

auto Session::analyze(CancellationToken const& token) -> Expected<StructureInfo> {
    {
        std::lock_guard<std::mutex> lock(this->stateMutex);
        if (this->structure)
            return *this->structure;
    }
    auto info = JL::analyze(*this->document_, token);
    if (info) {
        std::lock_guard<std::mutex> lock(this->stateMutex);
        this->structure = *info;
    }
    return info;
}

auto Session::analyzeAsync(CancellationToken const& token) -> std::future<Expected<StructureInfo>> {
    return this->runInBackground<StructureInfo>([this, token] { return this->analyze(token); });
}

auto Session::nodeAt(Path const& path) -> Expected<std::shared_ptr<LazyNode>> {
    if (auto cached = this->cache_.get(path))
        return cached;

    auto node = this->root_;
    for (auto const& segment : path.segments()) {
        node = node->childFor(segment);
        if (!node)
            return std::unexpected(Error{Error::Code::NoSuchPath, "node is not materialized: " + path.toString()});
    }
    this->cache_.put(node);
    return node;
}

auto Session::expand(std::shared_ptr<LazyNode> const& node, ExpandRequest request) -> LoadTicket {
    return this->loader_->expand(node, request);
}

auto Session::expandAndWait(std::shared_ptr<LazyNode> const& node, ExpandRequest request) -> Expected<LoadOutcome> {
    return this->loader_->expand(node, request).wait();
}

auto Session::loadMore(std::shared_ptr<LazyNode> const& node, std::optional<std::size_t> count) -> LoadTicket {
    return this->loader_->loadMore(node, count);
}

auto Session::collapse(std::shared_ptr<LazyNode> const& node) -> void {
    if (!node)
        return;
    node->setExpanded(false);
    this->events_.publish(Event{.kind = EventKind::NodeUpdated, .path = node->path()});
}

auto Session::setFocus(std::optional<Path> path) -> void {
    std::lock_guard<std::mutex> lock(this->stateMutex);
    this->focus_ = std::move(path);
}

auto Session::focus() const -> std::optional<Path> {
    std::lock_guard<std::mutex> lock(this->stateMutex);
    return this->focus_;
}

auto Session::rebuildIndex(CancellationToken const& token) -> Expected<IndexStats> {
    return this->search_.rebuild(this->root_, token);
}

auto Session::search(std::string query, SearchOptions options, CancellationToken const& token)
        -> std::future<Expected<std::vector<SearchResult>>> {
    return this->runInBackground<std::vector<SearchResult>>(
            [this, query = std::move(query), options, token] { return this->search_.query(query, options, token); });
}

auto Session::searchNow(std::string_view query, SearchOptions const& options, CancellationToken const& token)
        -> Expected<std::vector<SearchResult>> {
    return this->search_.query(query, options, token);
}

auto Session::memoryStatus() const -> MemoryStatus {
    return this->monitor_->status();
}

auto Session::memoryStatistics() const -> MemoryStatistics {
    return this->monitor_->statistics();
}

auto Session::loaderStatus() const -> LoaderStatus {
    return this->loader_->status();
}

auto Session::startMonitoring() -> bool {
    return this->monitor_->start();
}

auto Session::stopMonitoring() -> void {
    this->monitor_->stop();
}

auto Session::serialize(SerializeOptions const& options) const -> std::string {
    return JL::serialize(*this->root_, *this->document_, options);
}

auto Session::save(std::filesystem::path const& file, SerializeOptions const& options) const -> std::optional<Error> {
    std::ofstream stream(file, std::ios::binary | std::ios::trunc);
    if (!stream)
        return Error{Error::Code::IoError, "cannot open " + file.string() + " for writing"};
    stream << this->serialize(options);
    if (!stream)
        return Error{Error::Code::IoError, "write to " + file.string() + " failed"};
    jl_log("Session saved to " + file.string(), "Session");
    return std::nullopt;
}

} // namespace JL
