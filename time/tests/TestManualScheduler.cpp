/**
 * @file TestManualScheduler.cpp
 * @brief Unit tests for time::ManualScheduler.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "tether/time/ManualScheduler.hpp"

#include <stdexcept>
#include <vector>

namespace tether::time {

TEST_CASE("ManualScheduler fires one-shot timers at their deadline", "[time][scheduler]")
{
    ManualScheduler scheduler;
    int fired = 0;

    const TimerId id = scheduler.after(100.0, [&] { ++fired; });
    REQUIRE(id != kInvalidTimer);
    REQUIRE(scheduler.pending(id));

    REQUIRE(scheduler.advance(99.0) == 0);
    REQUIRE(fired == 0);

    REQUIRE(scheduler.advance(1.0) == 1);
    REQUIRE(fired == 1);
    REQUIRE_FALSE(scheduler.pending(id));

    scheduler.advance(1000.0);
    REQUIRE(fired == 1);
}

TEST_CASE("ManualScheduler reports each periodic deadline as now", "[time][scheduler]")
{
    ManualScheduler scheduler;
    std::vector<core::Millis> seen;

    scheduler.every(50.0, [&] { seen.push_back(scheduler.now()); });
    scheduler.advance(160.0);

    REQUIRE(seen.size() == 3);
    REQUIRE_THAT(seen[0], Catch::Matchers::WithinAbs(50.0, 1e-9));
    REQUIRE_THAT(seen[1], Catch::Matchers::WithinAbs(100.0, 1e-9));
    REQUIRE_THAT(seen[2], Catch::Matchers::WithinAbs(150.0, 1e-9));
    REQUIRE_THAT(scheduler.now(), Catch::Matchers::WithinAbs(160.0, 1e-9));
}

TEST_CASE("ManualScheduler orders timers by deadline then registration", "[time][scheduler]")
{
    ManualScheduler scheduler;
    std::vector<int> order;

    scheduler.after(20.0, [&] { order.push_back(3); });
    scheduler.after(10.0, [&] { order.push_back(1); });
    scheduler.after(10.0, [&] { order.push_back(2); });

    scheduler.advance(30.0);
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("ManualScheduler cancellation", "[time][scheduler]")
{
    ManualScheduler scheduler;
    int fired = 0;

    SECTION("cancel before the deadline")
    {
        const TimerId id = scheduler.after(10.0, [&] { ++fired; });
        REQUIRE(scheduler.cancel(id));
        REQUIRE_FALSE(scheduler.cancel(id));
        scheduler.advance(20.0);
        REQUIRE(fired == 0);
    }

    SECTION("periodic task cancels itself")
    {
        TimerId id = kInvalidTimer;
        id = scheduler.every(10.0, [&] {
            ++fired;
            if (fired == 2)
                scheduler.cancel(id);
        });
        scheduler.advance(100.0);
        REQUIRE(fired == 2);
        REQUIRE(scheduler.size() == 0);
    }
}

TEST_CASE("ManualScheduler runs zero-delay tasks scheduled from a task", "[time][scheduler]")
{
    ManualScheduler scheduler;
    std::vector<int> order;

    scheduler.after(10.0, [&] {
        order.push_back(1);
        scheduler.after(0.0, [&] { order.push_back(2); });
    });

    scheduler.advance(10.0);
    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("ManualScheduler survives a throwing task", "[time][scheduler]")
{
    ManualScheduler scheduler;
    int fired = 0;

    scheduler.after(5.0, [] { throw std::runtime_error{"boom"}; });
    scheduler.after(6.0, [&] { ++fired; });

    REQUIRE(scheduler.advance(10.0) == 2);
    REQUIRE(fired == 1);
}

TEST_CASE("ManualScheduler rejects invalid timers", "[time][scheduler]")
{
    ManualScheduler scheduler;

    REQUIRE(scheduler.every(0.0, [] {}) == kInvalidTimer);
    REQUIRE(scheduler.after(1.0, Task{}) == kInvalidTimer);
    REQUIRE_FALSE(scheduler.nextDeadline().has_value());
}

} // namespace tether::time
