#include <doctest/doctest.h>
#include "memory/NodeCache.hpp"

#include <vector>

using namespace JL;

namespace {

auto nodeAt(std::size_t index) -> std::shared_ptr<LazyNode> {
    return std::make_shared<LazyNode>(Path::Root().child(index), "[" + std::to_string(index) + "]", NodeKind::Number, "0", 0, Json(0));
}

} // namespace

TEST_CASE("NodeCache lookups") {
    NodeCache cache(10);
    auto      node = nodeAt(1);
    CHECK(cache.put(node));
    CHECK(cache.get(node->path()) == node);
    CHECK(cache.get(Path::Root().child(std::size_t{2})) == nullptr);
    CHECK(cache.hits() == 1);
    CHECK(cache.misses() == 1);
    CHECK(cache.hitRate() == doctest::Approx(0.5));

    CHECK(cache.remove(node->path()));
    CHECK_FALSE(cache.remove(node->path()));
    CHECK(cache.size() == 0);
}

TEST_CASE("NodeCache entries do not keep nodes alive") {
    NodeCache cache(10);
    auto      node = nodeAt(3);
    auto      path = node->path();
    REQUIRE(cache.put(node));
    node.reset();
    CHECK(cache.get(path) == nullptr);
    CHECK(cache.size() == 0);
}

TEST_CASE("NodeCache purge and capacity") {
    SUBCASE("Expired entries are purged in batches") {
        NodeCache                              cache(1'000);
        std::vector<std::shared_ptr<LazyNode>> alive;
        for (std::size_t i = 0; i < 130; ++i) {
            auto node = nodeAt(i);
            REQUIRE(cache.put(node));
            if (i % 10 == 0)
                alive.push_back(node);
        }
        CHECK(cache.size() == 130);
        CHECK(cache.purgeExpired() == 117);
        CHECK(cache.size() == 13);
        CHECK(cache.get(alive[5]->path()) == alive[5]);
    }

    SUBCASE("Full cache makes room from expired entries only") {
        NodeCache cache(2);
        auto      a = nodeAt(0);
        auto      b = nodeAt(1);
        REQUIRE(cache.put(a));
        REQUIRE(cache.put(b));
        auto c = nodeAt(2);
        CHECK_FALSE(cache.put(c));
        // Re-putting a present key is always allowed.
        CHECK(cache.put(a));

        b.reset();
        CHECK(cache.put(c));
        CHECK(cache.size() == 2);
    }

    SUBCASE("Clear") {
        NodeCache cache(10);
        auto      node = nodeAt(0);
        REQUIRE(cache.put(node));
        cache.clear();
        CHECK(cache.size() == 0);
    }
}
