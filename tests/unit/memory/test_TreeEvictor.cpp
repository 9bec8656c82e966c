#include <doctest/doctest.h>
#include "MemoryTestTree.hpp"
#include "memory/TreeEvictor.hpp"

using namespace JL;
using namespace JL::Testing;
using namespace std::chrono_literals;

TEST_CASE("TreeEvictor sweeps") {
    SampleTree tree;
    REQUIRE(countMaterialized(*tree.root) == 10);

    SUBCASE("Aggressive sweep drops every collapsed subtree") {
        TreeEvictor evictor;
        auto        result = evictor.sweep(tree.root, SweepPolicy{.kind = CleanupKind::Aggressive});
        CHECK(result.nodesEvicted == 4);
        CHECK(result.nodesReleased == 6);
        CHECK(tree.root->isLoaded());
        CHECK(tree.a->isLoaded());
        CHECK(tree.a1->state() == LoadState::Idle);
        CHECK(tree.b->state() == LoadState::Idle);
        CHECK(tree.c->state() == LoadState::Idle);
        CHECK(countMaterialized(*tree.root) == 4);

        REQUIRE(result.evicted.size() == 4);
        CHECK(result.evicted.front().path == tree.a1->path());
        CHECK(result.evicted.front().released == 2);
        CHECK(result.evicted.back().path == tree.c->path());
    }

    SUBCASE("Expanded nodes under a collapsed ancestor do not pin it") {
        tree.b1->setExpanded(true);
        TreeEvictor evictor;
        auto        result = evictor.sweep(tree.root, SweepPolicy{.kind = CleanupKind::Aggressive});
        CHECK(result.nodesEvicted == 3);
        CHECK(result.nodesReleased == 6);
        CHECK(tree.b->state() == LoadState::Idle);
        CHECK(tree.b->children().empty());
        CHECK(tree.c->state() == LoadState::Idle);
        CHECK(countMaterialized(*tree.root) == 4);
    }

    SUBCASE("Collapsing the top of an expanded chain frees the chain") {
        tree.a1->setExpanded(true);
        tree.a->setExpanded(false);
        TreeEvictor evictor;
        auto        result = evictor.sweep(tree.root, SweepPolicy{.kind = CleanupKind::Emergency});
        CHECK(tree.a->state() == LoadState::Idle);
        CHECK(tree.a1->isLoaded());
        CHECK(result.nodesEvicted == 4);
        CHECK(countMaterialized(*tree.root) == 3);
        CHECK(tree.root->isLoaded());
    }

    SUBCASE("A load in flight below a collapsed node keeps the chain") {
        tree.a->setExpanded(false);
        REQUIRE(tree.a1->tryEvict().has_value());
        REQUIRE(tree.a1->beginLoad());
        TreeEvictor evictor;
        evictor.sweep(tree.root, SweepPolicy{.kind = CleanupKind::Emergency});
        CHECK(tree.a->isLoaded());
        CHECK(tree.a1->isLoading());
        tree.a1->cancelLoad();
    }

    SUBCASE("Focus path is kept") {
        TreeEvictor evictor;
        auto        result = evictor.sweep(tree.root, SweepPolicy{.kind = CleanupKind::Emergency, .focus = tree.b1->path()});
        CHECK(result.nodesEvicted == 2);
        CHECK(tree.b->isLoaded());
        CHECK(tree.b1->isLoaded());
        CHECK(tree.a1->state() == LoadState::Idle);
    }

    SUBCASE("Regular sweep spares recently touched nodes") {
        TreeEvictor evictor;
        auto const  now    = LazyNode::Clock::now();
        auto        recent = evictor.sweep(tree.root, SweepPolicy{.kind = CleanupKind::Regular, .now = now, .idleGrace = 1h});
        CHECK(recent.nodesEvicted == 0);
        auto idle = evictor.sweep(tree.root, SweepPolicy{.kind = CleanupKind::Regular, .now = now + 2h, .idleGrace = 1h});
        CHECK(idle.nodesEvicted == 4);
    }

    SUBCASE("Minimum depth limits the sweep") {
        TreeEvictor evictor;
        auto        result = evictor.sweep(tree.root, SweepPolicy{.kind = CleanupKind::Aggressive, .minDepth = 1});
        CHECK(result.nodesEvicted == 2);
        CHECK(tree.a1->state() == LoadState::Idle);
        CHECK(tree.b1->state() == LoadState::Idle);
        CHECK(tree.b->isLoaded());
        CHECK(tree.c->isLoaded());
    }

    SUBCASE("Loading nodes are never evicted") {
        REQUIRE(tree.c->tryEvict().has_value());
        REQUIRE(tree.c->beginLoad());
        TreeEvictor evictor;
        evictor.sweep(tree.root, SweepPolicy{.kind = CleanupKind::Emergency});
        CHECK(tree.c->isLoading());
        tree.c->cancelLoad();
    }
}
