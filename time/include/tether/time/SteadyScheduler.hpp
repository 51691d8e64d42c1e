/**
 * @file SteadyScheduler.hpp
 * @brief Wall-clock scheduler polled from the host's frame loop.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_TIME_STEADYSCHEDULER_HPP
    #define TETHER_TIME_STEADYSCHEDULER_HPP

#include <tether/time/TimerQueue.hpp>

#include <chrono>

namespace tether::time {

/**
 * @class SteadyScheduler
 * @brief Timer service on std::chrono::steady_clock.
 *
 * Hosts with a render loop call poll() once per frame. Hosts without one
 * call run(), which sleeps until the next deadline and returns once
 * requestStop() has been called. Periodic timers that fell behind skip the
 * missed periods instead of firing in a burst.
 */
class SteadyScheduler final : public TimerQueue
{
public:
    using Clock = std::chrono::steady_clock;

    SteadyScheduler();

    /** @brief Milliseconds elapsed since construction. */
    [[nodiscard]] core::Millis now() const override;

    /** @brief Fires every timer due now. */
    core::u32 poll();

    /** @brief Blocks, firing timers, until requestStop() is called. */
    void run();

    /** @brief Makes run() return after the current task. */
    void requestStop() noexcept;

protected:
    [[nodiscard]] core::Millis followingDeadline(core::Millis deadline,
                                                 core::Millis period) const override;

private:
    Clock::time_point _epoch;
    bool              _running{false};
};

} // namespace tether::time

#endif // TETHER_TIME_STEADYSCHEDULER_HPP
