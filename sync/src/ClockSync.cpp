/**
 * @file ClockSync.cpp
 * @brief ClockSync implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/ClockSync.hpp>

namespace tether::sync {

ClockSync::ClockSync(core::f64 alpha)
    : _alpha{alpha}
{}

void ClockSync::observe(core::Millis serverTime, core::Millis localNow) noexcept
{
    const core::Millis sample = localNow - serverTime;
    if (!_hasOffset)
    {
        _offset = sample;
        _hasOffset = true;
        return;
    }
    _offset = _offset * (1.0 - _alpha) + sample * _alpha;
}

core::Millis ClockSync::toLocalTime(core::Millis serverTime) const noexcept
{
    return serverTime + _offset;
}

core::Millis ClockSync::offset() const noexcept { return _offset; }
bool         ClockSync::hasOffset() const noexcept { return _hasOffset; }

void ClockSync::onPingSent(core::Millis localNow) noexcept
{
    _pingSentAt = localNow;
}

std::optional<core::Millis> ClockSync::onPong(core::Millis localNow) noexcept
{
    if (!_pingSentAt)
        return std::nullopt;

    const core::Millis rtt = localNow - *_pingSentAt;
    _pingSentAt.reset();
    _latency = rtt > 0.0 ? rtt : 0.0;
    return _latency;
}

core::Millis ClockSync::latency() const noexcept { return _latency; }

void ClockSync::reset() noexcept
{
    _offset = 0.0;
    _hasOffset = false;
    _pingSentAt.reset();
    _latency = 0.0;
}

} // namespace tether::sync
