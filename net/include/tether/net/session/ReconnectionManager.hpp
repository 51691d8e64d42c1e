/**
 * @file ReconnectionManager.hpp
 * @brief Exponential-backoff reconnection state machine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TETHER_NET_SESSION_RECONNECTIONMANAGER_HPP
    #define TETHER_NET_SESSION_RECONNECTIONMANAGER_HPP

#include <tether/time/IScheduler.hpp>
#include <tether/core/Constants.hpp>
#include <tether/core/NonCopyable.hpp>
#include <tether/core/Types.hpp>

#include <string_view>

namespace tether::net::session {

/**
 * @enum ConnectionState
 * @brief Lifecycle of a room session as seen by the application.
 */
enum class ConnectionState : core::u8
{
    Idle,
    Connecting,
    Connected,
    Reconnecting,
    Failed,
    Disconnected
};

[[nodiscard]] std::string_view toString(ConnectionState state) noexcept;

/** @brief Retry policy. */
struct ReconnectPolicy
{
    bool         autoReconnect{core::kDefaultAutoReconnect};
    core::u32    maxAttempts{core::kDefaultMaxReconnects};
    core::Millis baseDelay{core::kReconnectBaseDelay};
    core::Millis maxDelay{core::kReconnectMaxDelay};
};

/**
 * @enum LossOutcome
 * @brief What onConnectionLost() decided.
 */
enum class LossOutcome : core::u8
{
    RetryScheduled,
    Exhausted,
    NotRetrying,
    Ignored
};

/**
 * @class ReconnectionManager
 * @brief Decides whether and when a lost session is reopened.
 *
 * The n-th consecutive attempt waits min(base * 2^(n-1), max). A successful
 * reopen resets the counter. Once the counter would exceed the policy's
 * ceiling the manager enters Failed and schedules nothing until begin() is
 * called for a fresh join.
 */
class ReconnectionManager final : public core::NonCopyable<ReconnectionManager>
{
public:
    ReconnectionManager(time::IScheduler& scheduler, ReconnectPolicy policy);
    ~ReconnectionManager();

    /** @brief Delay before attempt @p attempt (1-based). */
    [[nodiscard]] static core::Millis backoffDelay(core::u32 attempt,
                                                   core::Millis baseDelay = core::kReconnectBaseDelay,
                                                   core::Millis maxDelay = core::kReconnectMaxDelay) noexcept;

    /** @brief A fresh join starts: Connecting, counter cleared. */
    void begin();

    /**
     * @brief The transport opened.
     * @return @c true if this completed a reconnection.
     */
    bool onConnected();

    /**
     * @brief The transport was lost unexpectedly.
     *
     * Only meaningful while Connected or Reconnecting; in any other state
     * the call is Ignored.
     * @param retry Task run when the backoff delay elapses.
     */
    LossOutcome onConnectionLost(time::Task retry);

    /** @brief Explicit leave: Disconnected, pending retry cancelled. */
    void stop();

    [[nodiscard]] ConnectionState state() const noexcept;
    [[nodiscard]] core::u32       attempt() const noexcept;
    [[nodiscard]] core::Millis    lastDelay() const noexcept;
    [[nodiscard]] bool            retryPending() const;
    [[nodiscard]] const ReconnectPolicy& policy() const noexcept;

private:
    void cancelRetry();

    time::IScheduler& _scheduler;
    ReconnectPolicy   _policy;
    ConnectionState   _state{ConnectionState::Idle};
    core::u32         _attempt{0};
    core::Millis      _lastDelay{0.0};
    time::TimerId     _retryTimer{time::kInvalidTimer};
};

} // namespace tether::net::session

#endif // TETHER_NET_SESSION_RECONNECTIONMANAGER_HPP
