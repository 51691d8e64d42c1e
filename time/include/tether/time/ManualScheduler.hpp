/**
 * @file ManualScheduler.hpp
 * @brief Virtual-time scheduler advanced explicitly by the caller.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_TIME_MANUALSCHEDULER_HPP
    #define TETHER_TIME_MANUALSCHEDULER_HPP

#include <tether/time/TimerQueue.hpp>

namespace tether::time {

/**
 * @class ManualScheduler
 * @brief Deterministic clock for tests and for hosts that own their time.
 *
 * While a task runs, now() reports that task's deadline, so a 50 ms
 * periodic timer observes 50, 100, 150... during a single advance(150).
 */
class ManualScheduler final : public TimerQueue
{
public:
    explicit ManualScheduler(core::Millis start = 0.0);

    [[nodiscard]] core::Millis now() const override;

    /**
     * @brief Moves the clock forward by @p delta ms, firing due timers.
     * @return Number of tasks executed.
     */
    core::u32 advance(core::Millis delta);

    /** @brief Fires the timers already due at the current time. */
    core::u32 runPending();

protected:
    void onFire(core::Millis deadline) override;

private:
    core::Millis _now;
};

} // namespace tether::time

#endif // TETHER_TIME_MANUALSCHEDULER_HPP
