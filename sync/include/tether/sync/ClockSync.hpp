/**
 * @file ClockSync.hpp
 * @brief Relay clock offset estimation and ping/pong latency.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_CLOCKSYNC_HPP
    #define TETHER_SYNC_CLOCKSYNC_HPP

#include <tether/core/Constants.hpp>
#include <tether/core/Types.hpp>

#include <optional>

namespace tether::sync {

/**
 * @class ClockSync
 * @brief Translates relay timestamps into local time.
 *
 * Every inbound relay timestamp yields a sample localNow - serverTime.
 * The first sample is taken as-is; later ones are folded in with an
 * exponential moving average. Latency is the round trip of the last
 * answered ping.
 */
class ClockSync final
{
public:
    explicit ClockSync(core::f64 alpha = core::kClockOffsetAlpha);

    /** @brief Folds in one (server timestamp, local receive time) pair. */
    void observe(core::Millis serverTime, core::Millis localNow) noexcept;

    /** @brief Local time corresponding to @p serverTime. */
    [[nodiscard]] core::Millis toLocalTime(core::Millis serverTime) const noexcept;

    /** @brief Current estimate of localNow - serverTime (0 until observed). */
    [[nodiscard]] core::Millis offset() const noexcept;

    [[nodiscard]] bool hasOffset() const noexcept;

    /** @brief A ping left at @p localNow. Replaces any unanswered ping. */
    void onPingSent(core::Millis localNow) noexcept;

    /**
     * @brief Matches a pong to the outstanding ping.
     * @return The measured round trip, or nullopt if no ping was pending.
     */
    std::optional<core::Millis> onPong(core::Millis localNow) noexcept;

    /** @brief Last measured round trip in ms (0 until the first pong). */
    [[nodiscard]] core::Millis latency() const noexcept;

    /** @brief Forgets every estimate (new session). */
    void reset() noexcept;

private:
    core::f64                   _alpha;
    core::Millis                _offset{0.0};
    bool                        _hasOffset{false};
    std::optional<core::Millis> _pingSentAt;
    core::Millis                _latency{0.0};
};

} // namespace tether::sync

#endif // TETHER_SYNC_CLOCKSYNC_HPP
