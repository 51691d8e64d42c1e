/**
 * @file ReconnectionManager.cpp
 * @brief ReconnectionManager implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/net/session/ReconnectionManager.hpp>
#include <tether/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace tether::net::session {

std::string_view toString(ConnectionState state) noexcept
{
    switch (state)
    {
        case ConnectionState::Idle:         return "idle";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
        case ConnectionState::Failed:       return "failed";
        case ConnectionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

ReconnectionManager::ReconnectionManager(time::IScheduler& scheduler, ReconnectPolicy policy)
    : _scheduler{scheduler}
    , _policy{policy}
{}

ReconnectionManager::~ReconnectionManager()
{
    cancelRetry();
}

core::Millis ReconnectionManager::backoffDelay(core::u32 attempt,
                                               core::Millis baseDelay,
                                               core::Millis maxDelay) noexcept
{
    if (attempt == 0)
        return 0.0;
    // 2^31 already exceeds any sane ceiling; clamp the exponent first.
    const auto exponent = static_cast<core::f64>(std::min<core::u32>(attempt - 1, 31));
    return std::min(baseDelay * std::exp2(exponent), maxDelay);
}

void ReconnectionManager::begin()
{
    cancelRetry();
    _state = ConnectionState::Connecting;
    _attempt = 0;
    _lastDelay = 0.0;
}

bool ReconnectionManager::onConnected()
{
    const bool reconnected = _state == ConnectionState::Reconnecting;
    cancelRetry();
    _state = ConnectionState::Connected;
    _attempt = 0;
    return reconnected;
}

LossOutcome ReconnectionManager::onConnectionLost(time::Task retry)
{
    if (_state != ConnectionState::Connected && _state != ConnectionState::Reconnecting)
        return LossOutcome::Ignored;

    if (!_policy.autoReconnect)
    {
        _state = ConnectionState::Disconnected;
        return LossOutcome::NotRetrying;
    }

    if (_attempt >= _policy.maxAttempts)
    {
        cancelRetry();
        _state = ConnectionState::Failed;
        core::Log::error("Reconnect", "giving up after " + std::to_string(_attempt) + " attempts");
        return LossOutcome::Exhausted;
    }

    ++_attempt;
    _lastDelay = backoffDelay(_attempt, _policy.baseDelay, _policy.maxDelay);
    _state = ConnectionState::Reconnecting;

    cancelRetry();
    _retryTimer = _scheduler.after(_lastDelay, [this, retry = std::move(retry)] {
        _retryTimer = time::kInvalidTimer;
        retry();
    });

    core::Log::info("Reconnect", "attempt " + std::to_string(_attempt) + " in "
                    + std::to_string(static_cast<core::u64>(_lastDelay)) + " ms");
    return LossOutcome::RetryScheduled;
}

void ReconnectionManager::stop()
{
    cancelRetry();
    _state = ConnectionState::Disconnected;
}

ConnectionState ReconnectionManager::state() const noexcept  { return _state; }
core::u32       ReconnectionManager::attempt() const noexcept { return _attempt; }
core::Millis    ReconnectionManager::lastDelay() const noexcept { return _lastDelay; }
const ReconnectPolicy& ReconnectionManager::policy() const noexcept { return _policy; }

bool ReconnectionManager::retryPending() const
{
    return _retryTimer != time::kInvalidTimer && _scheduler.pending(_retryTimer);
}

void ReconnectionManager::cancelRetry()
{
    if (_retryTimer != time::kInvalidTimer)
    {
        _scheduler.cancel(_retryTimer);
        _retryTimer = time::kInvalidTimer;
    }
}

} // namespace tether::net::session
