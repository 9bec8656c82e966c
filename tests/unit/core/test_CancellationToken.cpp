#include <doctest/doctest.h>
#include "core/CancellationToken.hpp"

#include <chrono>
#include <thread>

using namespace JL;
using namespace std::chrono_literals;

TEST_CASE("CancellationToken") {
    SUBCASE("Default token never fires") {
        CancellationToken token;
        CHECK_FALSE(token.isCancelled());
        CHECK_FALSE(token.deadline().has_value());
        CHECK_FALSE(token.check().has_value());
    }

    SUBCASE("Copies share the flag") {
        CancellationToken token;
        CancellationToken copy = token;
        copy.cancel();
        CHECK(token.isCancelled());
        auto error = token.check();
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::Cancelled);
    }

    SUBCASE("Deadline produces Timeout") {
        auto now   = CancellationToken::Clock::now();
        auto token = CancellationToken{}.withDeadline(now + 10ms);
        CHECK_FALSE(token.check(now).has_value());
        auto error = token.check(now + 20ms);
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::Timeout);
    }

    SUBCASE("Derived token follows its parent and keeps the earlier deadline") {
        CancellationToken parent;
        auto const        now     = CancellationToken::Clock::now();
        auto              derived = parent.withDeadline(now + 1h);
        CHECK_FALSE(derived.check(now).has_value());
        parent.cancel();
        auto error = derived.check(now);
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::Cancelled);

        auto bounded = CancellationToken{}.withDeadline(now + 5ms).withDeadline(now + 1h);
        REQUIRE(bounded.deadline().has_value());
        CHECK(*bounded.deadline() == now + 5ms);
    }

    SUBCASE("Cancellation is visible across threads") {
        CancellationToken token;
        std::thread       worker([token] { token.cancel(); });
        worker.join();
        CHECK(token.isCancelled());
    }
}
