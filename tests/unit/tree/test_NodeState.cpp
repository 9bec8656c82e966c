#include <doctest/doctest.h>
#include "tree/NodeState.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace JL;

TEST_CASE("NodeStateAtomic transitions") {
    SUBCASE("Load lifecycle") {
        NodeStateAtomic state;
        CHECK(state.get() == LoadState::Idle);
        CHECK(state.tryBeginLoad());
        CHECK(state.isLoading());
        CHECK_FALSE(state.tryBeginLoad());
        CHECK(state.markLoaded());
        CHECK(state.isLoaded());
        CHECK(state.toString() == "Loaded");
    }

    SUBCASE("Failed is retryable") {
        NodeStateAtomic state;
        REQUIRE(state.tryBeginLoad());
        CHECK(state.markFailed());
        CHECK(state.isFailed());
        CHECK(state.tryBeginLoad());
    }

    SUBCASE("Eviction only from Loaded") {
        NodeStateAtomic state;
        CHECK_FALSE(state.tryEvict());
        REQUIRE(state.tryBeginLoad());
        CHECK_FALSE(state.tryEvict());
        REQUIRE(state.markLoaded());
        CHECK(state.tryEvict());
        CHECK(state.get() == LoadState::Idle);
    }

    SUBCASE("Append goes back through Loading") {
        NodeStateAtomic state;
        CHECK_FALSE(state.tryBeginAppend());
        REQUIRE(state.tryBeginLoad());
        REQUIRE(state.markLoaded());
        CHECK(state.tryBeginAppend());
        CHECK_FALSE(state.tryEvict());
        CHECK(state.markLoaded());
    }

    SUBCASE("Only one thread wins the load") {
        NodeStateAtomic          state;
        std::atomic<int>         winners{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i)
            threads.emplace_back([&] {
                if (state.tryBeginLoad())
                    ++winners;
            });
        for (auto& thread : threads)
            thread.join();
        CHECK(winners == 1);
    }
}
