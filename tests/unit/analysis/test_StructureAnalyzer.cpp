#include <doctest/doctest.h>
#include "analysis/StructureAnalyzer.hpp"

using namespace JL;

TEST_CASE("StructureAnalyzer counts") {
    auto document = Document::parse(R"({"name": "lens", "tags": ["a", "bc"], "meta": {"size": 3, "ok": true, "none": null}, "empty": []})");
    REQUIRE(document.has_value());

    auto info = analyze(**document);
    REQUIRE(info.has_value());
    // root, name, tags, "a", "bc", meta, size, ok, none, empty
    CHECK(info->totalNodes == 10);
    CHECK(info->objectCount == 2);
    CHECK(info->arrayCount == 2);
    CHECK(info->stringCount == 3);
    CHECK(info->numberCount == 1);
    CHECK(info->booleanCount == 1);
    CHECK(info->nullCount == 1);
    CHECK(info->propertyCount == 7);
    CHECK(info->arrayItemCount == 2);
    CHECK(info->maxArrayLength == 2);
    CHECK(info->totalStringLength == 7);
    CHECK(info->maxStringLength == 4);
    CHECK(info->maxDepth == 2);
    CHECK(info->byteSize == (*document)->byteSize());
    CHECK(info->summary().find("nodes: 10") != std::string::npos);
}

TEST_CASE("StructureAnalyzer scalar root and cancellation") {
    SUBCASE("Scalar root") {
        auto document = Document::parse("42");
        REQUIRE(document.has_value());
        auto info = analyze(**document);
        REQUIRE(info.has_value());
        CHECK(info->totalNodes == 1);
        CHECK(info->numberCount == 1);
        CHECK(info->maxDepth == 0);
    }

    SUBCASE("Cancelled before start") {
        auto document = Document::parse("[1, 2, 3]");
        REQUIRE(document.has_value());
        CancellationToken token;
        token.cancel();
        auto info = analyze(**document, token);
        REQUIRE_FALSE(info.has_value());
        CHECK(info.error().code == Error::Code::Cancelled);
    }
}
