#include <doctest/doctest.h>
#include "tree/LazyNode.hpp"
#include "tree/TreeMaterializer.hpp"

using namespace JL;
using namespace std::chrono_literals;

namespace {

auto loadAll(LazyNode& node, Document const& document) -> void {
    REQUIRE(node.beginLoad());
    auto result = materializeChildren(document, node.path());
    REQUIRE(result.has_value());
    node.appendChildren(result->children);
    node.completeLoad();
}

} // namespace

TEST_CASE("LazyNode load protocol") {
    auto document = Document::parse(R"({"a": {"b": [1, 2, 3]}, "c": "text"})");
    REQUIRE(document.has_value());
    auto root = makeRootNode(**document);

    SUBCASE("Load attaches children") {
        loadAll(*root, **document);
        CHECK(root->isLoaded());
        CHECK(root->loadedChildCount() == 2);
        CHECK_FALSE(root->isPartial());
        REQUIRE(root->childFor(PathSegment{"c"}) != nullptr);
        CHECK(root->childFor(PathSegment{"c"})->displayValue() == R"("text")");
        CHECK(root->childFor(PathSegment{"missing"}) == nullptr);
    }

    SUBCASE("Second load is refused while the first owns the node") {
        REQUIRE(root->beginLoad());
        CHECK_FALSE(root->beginLoad());
        root->cancelLoad();
        CHECK(root->state() == LoadState::Idle);
        CHECK(root->loadedChildCount() == 0);
    }

    SUBCASE("Failure keeps the error and allows a retry") {
        REQUIRE(root->beginLoad());
        root->failLoad(Error{Error::Code::Timeout, "slow"});
        CHECK(root->state() == LoadState::Failed);
        REQUIRE(root->lastError().has_value());
        CHECK(root->lastError()->code == Error::Code::Timeout);
        loadAll(*root, **document);
        CHECK_FALSE(root->lastError().has_value());
    }

    SUBCASE("Failed append keeps the pages already attached") {
        auto big = Document::parse("[0, 1, 2, 3, 4]");
        REQUIRE(big.has_value());
        auto node = makeRootNode(**big);
        REQUIRE(node->beginLoad());
        MaterializeOptions page;
        page.limit = 2;
        node->appendChildren(materializeChildren(**big, Path::Root(), page)->children);
        node->completeLoad();
        CHECK(node->isPartial());

        REQUIRE(node->beginAppend());
        node->failLoad(Error{Error::Code::Cancelled, ""});
        CHECK(node->isLoaded());
        CHECK(node->loadedChildCount() == 2);
    }

    SUBCASE("Eviction releases descendants") {
        loadAll(*root, **document);
        auto a = root->childFor(PathSegment{"a"});
        REQUIRE(a != nullptr);
        loadAll(*a, **document);
        auto b = a->childFor(PathSegment{"b"});
        loadAll(*b, **document);
        CHECK(countMaterialized(*root) == 6);

        auto released = root->tryEvict();
        REQUIRE(released.has_value());
        CHECK(*released == 6);
        CHECK(root->state() == LoadState::Idle);
        CHECK(root->loadedChildCount() == 0);
        CHECK_FALSE(root->tryEvict().has_value());
    }

    SUBCASE("Expanded flag touches the node") {
        auto const later = LazyNode::Clock::now() + 1h;
        root->setExpanded(true, later);
        CHECK(root->isExpanded());
        CHECK(root->lastTouched() == later);
        root->setExpanded(false);
        CHECK_FALSE(root->isExpanded());
    }
}
