#include <doctest/doctest.h>
#include "path/Path.hpp"

#include <unordered_set>

using namespace JL;

TEST_CASE("Path text form") {
    SUBCASE("Root") {
        CHECK(Path::Root().toString() == "$");
        CHECK(Path::Root().isRoot());
        CHECK(Path::Root().depth() == 0);
        CHECK_FALSE(Path::Root().parent().has_value());
    }

    SUBCASE("Names and indices") {
        auto path = Path::Root().child("users").child(std::size_t{3}).child("name");
        CHECK(path.toString() == "$.users[3].name");
        CHECK(path.depth() == 3);
        CHECK(path.back().label() == "name");
        CHECK(path.parent()->back().label() == "[3]");
    }

    SUBCASE("Names that are not identifiers are quoted") {
        auto path = Path::Root().child("first name").child("it's");
        CHECK(path.toString() == "$['first name']['it\\'s']");
        auto parsed = Path::parse(path.toString());
        REQUIRE(parsed.has_value());
        CHECK(*parsed == path);
    }
}

TEST_CASE("Path parsing") {
    SUBCASE("Mixed segments") {
        auto parsed = Path::parse("$.a[0]['b c'][\"d\"]");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->depth() == 4);
        CHECK(parsed->segments()[0].name() == "a");
        CHECK(parsed->segments()[1].index() == 0);
        CHECK(parsed->segments()[2].name() == "b c");
        CHECK(parsed->segments()[3].name() == "d");
    }

    SUBCASE("Rejected forms") {
        for (auto text : {"", "a.b", "$.", "$[", "$[x]", "$[1", "$['open]", "$.1abc", "$ a"}) {
            auto parsed = Path::parse(text);
            CHECK_FALSE(parsed.has_value());
            if (!parsed)
                CHECK(parsed.error().code == Error::Code::InvalidPath);
        }
    }
}

TEST_CASE("Path ordering and identity") {
    auto a  = Path::Root().child("a");
    auto a0 = a.child(std::size_t{0});
    auto a1 = a.child(std::size_t{1});
    auto b  = Path::Root().child("b");

    CHECK(a.isPrefixOf(a0));
    CHECK(Path::Root().isPrefixOf(b));
    CHECK_FALSE(a0.isPrefixOf(a));
    CHECK_FALSE(b.isPrefixOf(a0));
    CHECK(a < a0);
    CHECK(a0 < a1);
    CHECK(a1 < b);

    std::unordered_set<Path, PathHash> set{a, a0, a1, b, Path::parse("$.a[0]").value()};
    CHECK(set.size() == 4);
}
