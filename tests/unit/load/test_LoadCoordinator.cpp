#include <doctest/doctest.h>
#include "load/LoadCoordinator.hpp"
#include "tree/TreeMaterializer.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

using namespace JL;
using namespace std::chrono_literals;

namespace {

auto arrayOf(std::size_t count) -> std::shared_ptr<Document const> {
    std::string text = "[";
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0)
            text.push_back(',');
        text += "{\"id\":" + std::to_string(i) + "}";
    }
    text.push_back(']');
    auto document = Document::parse(text);
    REQUIRE(document.has_value());
    return *document;
}

auto smallConfig() -> LoaderConfig {
    LoaderConfig config;
    config.childLimit  = 100;
    config.batchSize   = 10;
    config.loadTimeout = 5'000ms;
    return config;
}

// Blocks the first batch of a load until open() is called.
struct Gate {
    std::promise<void>       promise;
    std::shared_future<void> released = promise.get_future().share();
    std::promise<void>       enteredPromise;
    std::future<void>        entered = enteredPromise.get_future();
    std::atomic<bool>        signalled{false};

    auto hook() -> LoadCoordinator::BatchHook {
        return [this](Path const&, std::size_t) {
            if (!this->signalled.exchange(true))
                this->enteredPromise.set_value();
            this->released.wait();
        };
    }
    auto open() -> void { this->promise.set_value(); }
};

} // namespace

TEST_CASE("LoadCoordinator expansion") {
    auto document = arrayOf(1'000);

    SUBCASE("Expansion attaches at most the child limit") {
        EventChannel    events;
        LoadCoordinator loader(document, smallConfig(), &events);
        auto            root = makeRootNode(*document);

        auto outcome = loader.expand(root).wait();
        REQUIRE(outcome.has_value());
        CHECK(outcome->children.size() == 100);
        CHECK(outcome->totalCount == 1'000);
        CHECK(outcome->partial);
        CHECK(root->isExpanded());
        CHECK(root->isLoaded());
        CHECK(root->isPartial());
        CHECK(outcome->children[42]->key() == "[42]");

        std::size_t batches = 0;
        bool        loaded  = false;
        for (auto const& event : events.drain()) {
            if (event.kind == EventKind::ChildrenBatch)
                ++batches;
            if (event.kind == EventKind::ChildrenLoaded)
                loaded = (event.count == 100);
        }
        CHECK(batches == 10);
        CHECK(loaded);
    }

    SUBCASE("Expanding a loaded node returns its children without a new pass") {
        LoadCoordinator loader(document, smallConfig());
        auto            root = makeRootNode(*document);
        REQUIRE(loader.expand(root).wait().has_value());
        auto again = loader.expand(root);
        CHECK(again.ready());
        REQUIRE(again.wait().has_value());
        CHECK(again.wait()->children.size() == 100);
        CHECK(loader.status().materializationPasses == 1);
    }

    SUBCASE("Load more appends the next page") {
        LoadCoordinator loader(document, smallConfig());
        auto            root = makeRootNode(*document);
        REQUIRE(loader.expand(root).wait().has_value());
        auto more = loader.loadMore(root, 50).wait();
        REQUIRE(more.has_value());
        CHECK(more->children.size() == 150);
        CHECK(root->loadedChildCount() == 150);
        CHECK(root->children()[149]->key() == "[149]");

        auto rest = loader.loadMore(root, 10'000).wait();
        REQUIRE(rest.has_value());
        CHECK(rest->children.size() == 1'000);
        CHECK_FALSE(rest->partial);
        CHECK_FALSE(root->isPartial());
    }

    SUBCASE("Load more after an eviction starts a fresh load") {
        LoadCoordinator loader(document, smallConfig());
        auto            root = makeRootNode(*document);
        REQUIRE(loader.expand(root).wait().has_value());
        REQUIRE(loader.loadMore(root, std::size_t{50}).wait().has_value());
        root->setExpanded(false);
        REQUIRE(root->tryEvict().has_value());

        auto reloaded = loader.loadMore(root, std::size_t{30}).wait();
        REQUIRE(reloaded.has_value());
        CHECK(reloaded->children.size() == 30);
        CHECK(reloaded->children.front()->key() == "[0]");
        CHECK(reloaded->partial);
        CHECK(root->isLoaded());
        CHECK_FALSE(root->isExpanded());
    }

    SUBCASE("Scalar expansion resolves immediately") {
        LoadCoordinator loader(document, smallConfig());
        auto            leaf = makeNode(Json(5), Path::Root().child(std::size_t{0}).child("id"));
        auto            ticket = loader.expand(leaf);
        CHECK(ticket.ready());
        REQUIRE(ticket.wait().has_value());
        CHECK(ticket.wait()->children.empty());
    }

    SUBCASE("Unresolvable path fails the node") {
        EventChannel    events;
        LoadCoordinator loader(document, smallConfig(), &events);
        auto            ghost = std::make_shared<LazyNode>(Path::Root().child("ghost"), "ghost", NodeKind::Object, "{ 3 items }", 3);
        auto            outcome = loader.expand(ghost).wait();
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code == Error::Code::NoSuchPath);
        CHECK(ghost->state() == LoadState::Failed);
        CHECK(loader.status().failed == 1);

        bool sawFailure = false;
        for (auto const& event : events.drain())
            sawFailure = sawFailure || event.kind == EventKind::LoadFailed;
        CHECK(sawFailure);
    }
}

TEST_CASE("LoadCoordinator concurrency") {
    auto document = arrayOf(1'000);

    SUBCASE("Concurrent expansions share one materialization pass") {
        Gate            gate;
        LoadCoordinator loader(document, smallConfig());
        loader.setBatchHook(gate.hook());
        auto root = makeRootNode(*document);

        auto first = loader.expand(root);
        gate.entered.wait();
        auto second = loader.expand(root);
        CHECK_FALSE(first.coalesced());
        CHECK(second.coalesced());
        gate.open();

        auto a = first.wait();
        auto b = second.wait();
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        CHECK(a->children.size() == b->children.size());
        CHECK(a->children.front() == b->children.front());
        auto status = loader.status();
        CHECK(status.materializationPasses == 1);
        CHECK(status.coalesced == 1);
        CHECK(status.completed == 1);
    }

    SUBCASE("Timed out wait leaves the load running") {
        Gate            gate;
        LoadCoordinator loader(document, smallConfig());
        loader.setBatchHook(gate.hook());
        auto root = makeRootNode(*document);

        auto ticket = loader.expand(root);
        gate.entered.wait();
        auto early = ticket.waitFor(10ms);
        REQUIRE_FALSE(early.has_value());
        CHECK(early.error().code == Error::Code::Timeout);
        CHECK(loader.status().timeouts == 1);
        CHECK(root->isLoading());

        gate.open();
        auto late = ticket.wait();
        REQUIRE(late.has_value());
        CHECK(late->children.size() == 100);
        CHECK(root->isLoaded());
    }

    SUBCASE("Cancelling a running load leaves the node idle and retryable") {
        Gate            gate;
        LoadCoordinator loader(document, smallConfig());
        loader.setBatchHook(gate.hook());
        auto root = makeRootNode(*document);

        auto ticket = loader.expand(root);
        gate.entered.wait();
        CHECK(loader.cancel(root->path()));
        gate.open();

        auto outcome = ticket.wait();
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code == Error::Code::Cancelled);
        CHECK(root->state() == LoadState::Idle);
        CHECK(root->loadedChildCount() == 0);
        CHECK(loader.status().cancelled == 1);

        loader.setBatchHook({});
        auto retry = loader.expand(root).wait();
        REQUIRE(retry.has_value());
        CHECK(retry->children.size() == 100);
    }

    SUBCASE("Loads beyond the worker count queue") {
        LoaderConfig config = smallConfig();
        config.maxConcurrentLoads = 1;
        LoadCoordinator loader(document, config);
        auto            root = makeRootNode(*document);
        REQUIRE(loader.expand(root).wait().has_value());

        auto const                             all = root->children();
        std::vector<std::shared_ptr<LazyNode>> nodes(all.begin(), all.begin() + 20);
        auto results = loader.loadMany(nodes);
        CHECK(results.size() == 20);
        for (auto const& [path, ok] : results)
            CHECK(ok);
        CHECK(nodes[7]->isLoaded());
        CHECK_FALSE(nodes[7]->isExpanded());
    }

    SUBCASE("Preloading expands the first children without marking them") {
        LoadCoordinator loader(document, smallConfig());
        auto            root = makeRootNode(*document);
        auto            preloaded = loader.preloadChildren(root, 5);
        REQUIRE(preloaded.has_value());
        CHECK(*preloaded == 5);
        auto children = root->children();
        CHECK(children[4]->isLoaded());
        CHECK_FALSE(children[5]->isLoaded());
        CHECK_FALSE(root->isExpanded());
    }

    SUBCASE("A throwing batch hook fails the load and leaves it retryable") {
        LoadCoordinator loader(document, smallConfig());
        loader.setBatchHook([](Path const&, std::size_t) { throw std::runtime_error("hook failed"); });
        auto root = makeRootNode(*document);

        auto outcome = loader.expand(root).wait();
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code == Error::Code::UnknownError);
        CHECK(root->state() == LoadState::Failed);
        CHECK(root->loadedChildCount() == 0);
        CHECK(loader.status().failed == 1);
        CHECK(loader.status().inFlight == 0);

        loader.setBatchHook({});
        auto retry = loader.expand(root).wait();
        REQUIRE(retry.has_value());
        CHECK(retry->children.size() == 100);
        CHECK(root->isLoaded());
    }

    SUBCASE("A throwing listener does not stall the load") {
        EventChannel events;
        events.subscribe([](Event const& event) {
            if (event.kind == EventKind::ChildrenBatch)
                throw std::runtime_error("listener failed");
        });
        LoadCoordinator loader(document, smallConfig(), &events);
        auto            root = makeRootNode(*document);

        auto outcome = loader.expand(root).wait();
        REQUIRE(outcome.has_value());
        CHECK(outcome->children.size() == 100);
        CHECK(root->isLoaded());
    }

    SUBCASE("Requests after shutdown are refused") {
        LoadCoordinator loader(document, smallConfig());
        loader.shutdown();
        auto outcome = loader.expand(makeRootNode(*document)).wait();
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code == Error::Code::ShuttingDown);
    }
}
