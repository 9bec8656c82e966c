#include <doctest/doctest.h>
#include "tree/TreeMaterializer.hpp"
#include "tree/TreeSerializer.hpp"

using namespace JL;

TEST_CASE("Tree serialization") {
    SUBCASE("Fully loaded tree reproduces the input") {
        auto document = Document::parse(R"({"x":[1,"two",null,true]})");
        REQUIRE(document.has_value());
        auto root = makeRootNode(**document);
        REQUIRE(root->beginLoad());
        root->appendChildren(materializeChildren(**document, Path::Root())->children);
        root->completeLoad();
        auto x = root->childFor(PathSegment{"x"});
        REQUIRE(x->beginLoad());
        x->appendChildren(materializeChildren(**document, x->path())->children);
        x->completeLoad();

        CHECK(toJson(*root, **document) == (*document)->root());
        CHECK(serialize(*root, **document, {.indent = -1}) == R"({"x":[1,"two",null,true]})");
    }

    SUBCASE("Unloaded containers are filled from the document") {
        auto document = Document::parse(R"({"b": {"c": [1, 2]}, "a": 3})");
        REQUIRE(document.has_value());
        auto root = makeRootNode(**document);
        CHECK(toJson(*root, **document) == (*document)->root());
        // Key order follows the source.
        CHECK(serialize(*root, **document, {.indent = -1}) == R"({"b":{"c":[1,2]},"a":3})");
    }

    SUBCASE("Without filling, unloaded containers are empty") {
        auto document = Document::parse(R"({"b": {"c": [1, 2]}, "a": [3]})");
        REQUIRE(document.has_value());
        auto root = makeRootNode(**document);
        REQUIRE(root->beginLoad());
        root->appendChildren(materializeChildren(**document, Path::Root())->children);
        root->completeLoad();
        SerializeOptions options;
        options.indent       = -1;
        options.fillUnloaded = false;
        CHECK(serialize(*root, **document, options) == R"({"b":{},"a":[]})");
    }

    SUBCASE("Partially loaded arrays are written in full") {
        auto document = Document::parse("[1, 2, 3, 4]");
        REQUIRE(document.has_value());
        auto root = makeRootNode(**document);
        REQUIRE(root->beginLoad());
        MaterializeOptions page;
        page.limit = 2;
        root->appendChildren(materializeChildren(**document, Path::Root(), page)->children);
        root->completeLoad();
        CHECK(serialize(*root, **document, {.indent = -1}) == "[1,2,3,4]");
    }
}
