/**
 * @file TestLerpSmoother.cpp
 * @brief Unit tests for sync::LerpSmoother and sync::ClockSync.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "tether/sync/ClockSync.hpp"
#include "tether/sync/LerpSmoother.hpp"

#include <cmath>

namespace tether::sync {

using Catch::Matchers::WithinAbs;

TEST_CASE("LerpSmoother converges geometrically", "[sync][lerp]")
{
    PrivateFieldFilter filter;
    LerpSmoother smoother{0.15};

    Json::Value collection{Json::objectValue};
    collection["p2"]["x"] = 0.0;
    collection["p2"]["name"] = "Ann";

    PeerRecord target{Json::objectValue};
    target["x"] = 100.0;
    target["name"] = "Bob";
    smoother.setTarget("p2", target);

    for (int n = 1; n <= 10; ++n)
    {
        smoother.tick(collection, filter);
        const double expected = 100.0 - (100.0 - 0.0) * std::pow(1.0 - 0.15, n);
        REQUIRE_THAT(collection["p2"]["x"].asDouble(), WithinAbs(expected, 1e-9));
    }
    REQUIRE(collection["p2"]["name"].asString() == "Bob");
}

TEST_CASE("LerpSmoother keeps local private fields", "[sync][lerp]")
{
    PrivateFieldFilter filter;
    LerpSmoother smoother{0.5};

    Json::Value collection{Json::objectValue};
    collection["p2"]["x"] = 0.0;
    collection["p2"]["_selected"] = true;

    PeerRecord target{Json::objectValue};
    target["x"] = 10.0;
    smoother.setTarget("p2", target);
    smoother.tick(collection, filter);

    REQUIRE_THAT(collection["p2"]["x"].asDouble(), WithinAbs(5.0, 1e-9));
    REQUIRE(collection["p2"]["_selected"].asBool());
}

TEST_CASE("LerpSmoother recreates a missing entry from its target", "[sync][lerp]")
{
    PrivateFieldFilter filter;
    LerpSmoother smoother;

    Json::Value collection{Json::objectValue};
    PeerRecord target{Json::objectValue};
    target["x"] = 7;
    smoother.setTarget("p2", target);

    smoother.tick(collection, filter);
    REQUIRE(collection["p2"]["x"].asInt() == 7);

    smoother.erase("p2");
    REQUIRE_FALSE(smoother.hasTarget("p2"));
}

TEST_CASE("ClockSync smooths the offset and measures latency", "[sync][clock]")
{
    ClockSync clock;

    REQUIRE_FALSE(clock.hasOffset());
    clock.observe(1000.0, 1100.0);
    REQUIRE_THAT(clock.offset(), WithinAbs(100.0, 1e-9));
    REQUIRE_THAT(clock.toLocalTime(2000.0), WithinAbs(2100.0, 1e-9));

    clock.observe(2000.0, 2180.0);
    REQUIRE_THAT(clock.offset(), WithinAbs(100.0 * 0.875 + 180.0 * 0.125, 1e-9));

    REQUIRE_FALSE(clock.onPong(50.0).has_value());
    clock.onPingSent(3000.0);
    auto rtt = clock.onPong(3042.0);
    REQUIRE(rtt.has_value());
    REQUIRE_THAT(*rtt, WithinAbs(42.0, 1e-9));
    REQUIRE_THAT(clock.latency(), WithinAbs(42.0, 1e-9));

    clock.reset();
    REQUIRE_FALSE(clock.hasOffset());
    REQUIRE_THAT(clock.latency(), WithinAbs(0.0, 1e-9));
}

} // namespace tether::sync
