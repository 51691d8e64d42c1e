/**
 * @file TestSteadyScheduler.cpp
 * @brief Unit tests for time::SteadyScheduler.
 */

#include <catch2/catch_test_macros.hpp>

#include "tether/time/SteadyScheduler.hpp"

namespace tether::time {

TEST_CASE("SteadyScheduler clock is monotonic", "[time][steady]")
{
    SteadyScheduler scheduler;
    const core::Millis first = scheduler.now();
    const core::Millis second = scheduler.now();

    REQUIRE(first >= 0.0);
    REQUIRE(second >= first);
}

TEST_CASE("SteadyScheduler poll fires due timers only", "[time][steady]")
{
    SteadyScheduler scheduler;
    int immediate = 0;
    int later = 0;

    scheduler.after(0.0, [&] { ++immediate; });
    scheduler.after(60000.0, [&] { ++later; });

    REQUIRE(scheduler.poll() == 1);
    REQUIRE(immediate == 1);
    REQUIRE(later == 0);
    REQUIRE(scheduler.size() == 1);
}

TEST_CASE("SteadyScheduler run returns when the queue drains", "[time][steady]")
{
    SteadyScheduler scheduler;
    int fired = 0;

    scheduler.after(5.0, [&] { ++fired; });
    scheduler.run();

    REQUIRE(fired == 1);
    REQUIRE(scheduler.now() >= 5.0);
}

TEST_CASE("SteadyScheduler run stops on request", "[time][steady]")
{
    SteadyScheduler scheduler;
    int ticks = 0;

    scheduler.every(2.0, [&] {
        if (++ticks == 3)
            scheduler.requestStop();
    });
    scheduler.run();

    REQUIRE(ticks == 3);
    REQUIRE(scheduler.size() == 1);
}

} // namespace tether::time
