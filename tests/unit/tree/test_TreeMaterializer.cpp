#include <doctest/doctest.h>
#include "tree/TreeMaterializer.hpp"

#include <string>

using namespace JL;

namespace {

auto bigArray(std::size_t count) -> std::string {
    std::string text = "[";
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0)
            text.push_back(',');
        text += std::to_string(i);
    }
    text.push_back(']');
    return text;
}

} // namespace

TEST_CASE("Display values") {
    CHECK(displayValue(Json::parse(R"({"a": 1, "b": 2})")) == "{ 2 items }");
    CHECK(displayValue(Json::object()) == "{}");
    CHECK(displayValue(Json::parse("[1, 2, 3]")) == "[ 3 items ]");
    CHECK(displayValue(Json::array()) == "[]");
    CHECK(displayValue(Json("plain")) == R"("plain")");
    CHECK(displayValue(Json("")) == R"("")");
    CHECK(displayValue(Json(3.5)) == "3.5");
    CHECK(displayValue(Json(true)) == "true");
    CHECK(displayValue(Json(nullptr)) == "null");

    SUBCASE("Long strings are cut with an ellipsis") {
        std::string const text(150, 'x');
        auto const        shown = displayValue(Json(text), 100);
        CHECK(shown.size() == 105);
        CHECK(shown.starts_with("\"xxx"));
        CHECK(shown.ends_with("...\""));
    }

    SUBCASE("Cut never splits a UTF-8 sequence") {
        // The cut lands inside the two-byte é.
        std::string const text  = "a\xC3\xA9" + std::string(10, 'z');
        auto const        shown = displayValue(Json(text), 2);
        CHECK(shown == R"("a...")");
    }
}

TEST_CASE("Node construction") {
    auto document = Document::parse(R"({"list": [10, 20], "name": "x"})");
    REQUIRE(document.has_value());

    auto root = makeRootNode(**document);
    CHECK(root->key() == "root");
    CHECK(root->path().isRoot());
    CHECK(root->kind() == NodeKind::Object);
    CHECK(root->childCount() == 2);
    CHECK(root->isExpandable());
    CHECK(root->state() == LoadState::Idle);

    auto list = makeNode(*(*document)->resolve(Path::parse("$.list[1]").value()), Path::parse("$.list[1]").value());
    CHECK(list->key() == "[1]");
    CHECK(list->kind() == NodeKind::Number);
    CHECK(list->scalar() == 20);
    CHECK_FALSE(list->isExpandable());
}

TEST_CASE("Child materialization") {
    SUBCASE("Source order and immediate children only") {
        auto document = Document::parse(R"({"z": {"deep": [1, 2, 3]}, "a": 1, "m": [true]})");
        REQUIRE(document.has_value());
        auto result = materializeChildren(**document, Path::Root());
        REQUIRE(result.has_value());
        REQUIRE(result->children.size() == 3);
        CHECK(result->children[0]->key() == "z");
        CHECK(result->children[1]->key() == "a");
        CHECK(result->children[2]->key() == "m");
        CHECK(result->children[0]->childCount() == 1);
        CHECK(result->children[0]->loadedChildCount() == 0);
        CHECK(result->totalCount == 3);
        CHECK_FALSE(result->partial);
    }

    SUBCASE("Limit caps a large array") {
        auto document = Document::parse(bigArray(10'000));
        REQUIRE(document.has_value());
        MaterializeOptions options;
        options.limit     = 100;
        options.batchSize = 30;
        std::size_t batches = 0;
        auto result = materializeChildren(**document, Path::Root(), options, {}, [&](LazyNode::Children const& batch) {
            ++batches;
            CHECK(batch.size() <= 30);
        });
        REQUIRE(result.has_value());
        CHECK(result->children.size() == 100);
        CHECK(result->totalCount == 10'000);
        CHECK(result->partial);
        CHECK(batches == 4);
        CHECK(result->children.front()->key() == "[0]");
        CHECK(result->children.back()->key() == "[99]");
    }

    SUBCASE("Offset continues where a page ended") {
        auto document = Document::parse(bigArray(250));
        REQUIRE(document.has_value());
        MaterializeOptions options;
        options.offset = 200;
        options.limit  = 100;
        auto result    = materializeChildren(**document, Path::Root(), options);
        REQUIRE(result.has_value());
        CHECK(result->offset == 200);
        CHECK(result->children.size() == 50);
        CHECK(result->children.front()->scalar() == 200);
        CHECK_FALSE(result->partial);
    }

    SUBCASE("Unresolvable path") {
        auto document = Document::parse("[1]");
        REQUIRE(document.has_value());
        auto result = materializeChildren(**document, Path::parse("$[5]").value());
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::NoSuchPath);
    }

    SUBCASE("Scalar has no children") {
        auto document = Document::parse(R"({"n": 1})");
        REQUIRE(document.has_value());
        auto result = materializeChildren(**document, Path::parse("$.n").value());
        REQUIRE(result.has_value());
        CHECK(result->children.empty());
        CHECK(result->totalCount == 0);
    }

    SUBCASE("Cancelled token") {
        auto document = Document::parse("[1, 2]");
        REQUIRE(document.has_value());
        CancellationToken token;
        token.cancel();
        auto result = materializeChildren(**document, Path::Root(), {}, token);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::Cancelled);
    }
}
