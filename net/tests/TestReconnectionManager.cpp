/**
 * @file TestReconnectionManager.cpp
 * @brief Unit tests for net::session::ReconnectionManager.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "tether/net/session/ReconnectionManager.hpp"
#include "tether/time/ManualScheduler.hpp"

namespace tether::net::session {

using Catch::Matchers::WithinAbs;

TEST_CASE("ReconnectionManager backoff doubles up to the ceiling", "[net][reconnect]")
{
    REQUIRE_THAT(ReconnectionManager::backoffDelay(1), WithinAbs(1000.0, 1e-9));
    REQUIRE_THAT(ReconnectionManager::backoffDelay(2), WithinAbs(2000.0, 1e-9));
    REQUIRE_THAT(ReconnectionManager::backoffDelay(3), WithinAbs(4000.0, 1e-9));
    REQUIRE_THAT(ReconnectionManager::backoffDelay(4), WithinAbs(8000.0, 1e-9));
    REQUIRE_THAT(ReconnectionManager::backoffDelay(5), WithinAbs(16000.0, 1e-9));
    REQUIRE_THAT(ReconnectionManager::backoffDelay(6), WithinAbs(30000.0, 1e-9));
    REQUIRE_THAT(ReconnectionManager::backoffDelay(10), WithinAbs(30000.0, 1e-9));
    REQUIRE_THAT(ReconnectionManager::backoffDelay(1000), WithinAbs(30000.0, 1e-9));
}

TEST_CASE("ReconnectionManager schedules retries after a loss", "[net][reconnect]")
{
    time::ManualScheduler scheduler;
    ReconnectionManager manager{scheduler, ReconnectPolicy{}};
    int retries = 0;

    manager.begin();
    REQUIRE(manager.state() == ConnectionState::Connecting);

    SECTION("loss before the first open is not retried")
    {
        REQUIRE(manager.onConnectionLost([&] { ++retries; }) == LossOutcome::Ignored);
        REQUIRE_FALSE(manager.retryPending());
    }

    SECTION("loss after open retries with backoff")
    {
        REQUIRE_FALSE(manager.onConnected());
        REQUIRE(manager.state() == ConnectionState::Connected);

        REQUIRE(manager.onConnectionLost([&] { ++retries; }) == LossOutcome::RetryScheduled);
        REQUIRE(manager.state() == ConnectionState::Reconnecting);
        REQUIRE(manager.attempt() == 1);
        REQUIRE_THAT(manager.lastDelay(), WithinAbs(1000.0, 1e-9));

        scheduler.advance(999.0);
        REQUIRE(retries == 0);
        scheduler.advance(1.0);
        REQUIRE(retries == 1);

        REQUIRE(manager.onConnectionLost([&] { ++retries; }) == LossOutcome::RetryScheduled);
        REQUIRE(manager.attempt() == 2);
        REQUIRE_THAT(manager.lastDelay(), WithinAbs(2000.0, 1e-9));

        scheduler.advance(2000.0);
        REQUIRE(retries == 2);

        REQUIRE(manager.onConnected());
        REQUIRE(manager.state() == ConnectionState::Connected);
        REQUIRE(manager.attempt() == 0);
    }
}

TEST_CASE("ReconnectionManager gives up after the attempt ceiling", "[net][reconnect]")
{
    time::ManualScheduler scheduler;
    ReconnectPolicy policy;
    policy.maxAttempts = 3;
    ReconnectionManager manager{scheduler, policy};
    int retries = 0;

    manager.begin();
    manager.onConnected();

    for (int i = 0; i < 3; ++i)
    {
        REQUIRE(manager.onConnectionLost([&] { ++retries; }) == LossOutcome::RetryScheduled);
        scheduler.advance(manager.lastDelay());
    }
    REQUIRE(retries == 3);

    REQUIRE(manager.onConnectionLost([&] { ++retries; }) == LossOutcome::Exhausted);
    REQUIRE(manager.state() == ConnectionState::Failed);
    REQUIRE_FALSE(manager.retryPending());

    REQUIRE(manager.onConnectionLost([&] { ++retries; }) == LossOutcome::Ignored);
    scheduler.advance(60000.0);
    REQUIRE(retries == 3);

    manager.begin();
    REQUIRE(manager.state() == ConnectionState::Connecting);
    REQUIRE(manager.attempt() == 0);
}

TEST_CASE("ReconnectionManager without auto-reconnect disconnects", "[net][reconnect]")
{
    time::ManualScheduler scheduler;
    ReconnectPolicy policy;
    policy.autoReconnect = false;
    ReconnectionManager manager{scheduler, policy};

    manager.begin();
    manager.onConnected();
    REQUIRE(manager.onConnectionLost([] {}) == LossOutcome::NotRetrying);
    REQUIRE(manager.state() == ConnectionState::Disconnected);
    REQUIRE_FALSE(manager.retryPending());
}

TEST_CASE("ReconnectionManager stop cancels the pending retry", "[net][reconnect]")
{
    time::ManualScheduler scheduler;
    ReconnectionManager manager{scheduler, ReconnectPolicy{}};
    int retries = 0;

    manager.begin();
    manager.onConnected();
    manager.onConnectionLost([&] { ++retries; });
    REQUIRE(manager.retryPending());

    manager.stop();
    manager.stop();
    REQUIRE(manager.state() == ConnectionState::Disconnected);
    REQUIRE_FALSE(manager.retryPending());

    scheduler.advance(60000.0);
    REQUIRE(retries == 0);
}

} // namespace tether::net::session
