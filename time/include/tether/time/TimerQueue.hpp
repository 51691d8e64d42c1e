/**
 * @file TimerQueue.hpp
 * @brief Deadline-ordered timer storage shared by the concrete schedulers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_TIME_TIMERQUEUE_HPP
    #define TETHER_TIME_TIMERQUEUE_HPP

#include <tether/time/IScheduler.hpp>
#include <tether/core/NonCopyable.hpp>

#include <map>
#include <optional>

namespace tether::time {

/**
 * @class TimerQueue
 * @brief IScheduler implementation minus the clock.
 *
 * Subclasses provide now() and call runDue() to fire every timer whose
 * deadline is at or before a given instant. Ties fire in registration
 * order. A task that throws is logged and does not stop the queue.
 */
class TimerQueue : public IScheduler, public core::NonCopyable<TimerQueue>
{
public:
    TimerQueue() = default;
    ~TimerQueue() override = default;

    TimerId after(core::Millis delay, Task task) override;
    TimerId every(core::Millis period, Task task) override;
    bool cancel(TimerId id) override;
    [[nodiscard]] bool pending(TimerId id) const override;

    /** @brief Number of scheduled timers. */
    [[nodiscard]] core::usize size() const noexcept;

    /** @brief Earliest deadline, if any timer is scheduled. */
    [[nodiscard]] std::optional<core::Millis> nextDeadline() const;

protected:
    /**
     * @brief Fires every timer due at or before @p until.
     * @return Number of tasks executed.
     */
    core::u32 runDue(core::Millis until);

    /** @brief Hook invoked right before a task fires, with its deadline. */
    virtual void onFire(core::Millis /*deadline*/) {}

    /**
     * @brief Next deadline of a periodic timer that fired at @p deadline.
     *
     * The default keeps a fixed cadence (deadline + period) so that a
     * large virtual time step replays every missed tick.
     */
    [[nodiscard]] virtual core::Millis followingDeadline(core::Millis deadline,
                                                         core::Millis period) const;

private:
    struct Entry
    {
        core::Millis deadline;
        core::Millis period;
        Task         task;
    };

    TimerId schedule(core::Millis deadline, core::Millis period, Task task);

    std::map<TimerId, Entry> _timers;
    TimerId                  _nextId{1};
};

} // namespace tether::time

#endif // TETHER_TIME_TIMERQUEUE_HPP
