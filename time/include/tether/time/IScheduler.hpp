/**
 * @file IScheduler.hpp
 * @brief Injectable timer source driving every periodic task of the engine.
 *
 * The broadcast tick, the render tick, the latency ping, the connect
 * timeout and the reconnect backoff are all registered here instead of on
 * wall-clock timers, so that tests can advance virtual time
 * deterministically.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_TIME_ISCHEDULER_HPP
    #define TETHER_TIME_ISCHEDULER_HPP

#include <tether/core/Types.hpp>

#include <functional>

namespace tether::time {

/** @brief Handle of a registered timer. Zero is never issued. */
using TimerId = core::u64;

inline constexpr TimerId kInvalidTimer = 0;

/** @brief Work executed when a timer fires. */
using Task = std::function<void()>;

/**
 * @class IScheduler
 * @brief Single-threaded cooperative timer service (Strategy pattern).
 *
 * Concrete schedulers:
 *   - @c ManualScheduler: virtual clock advanced explicitly.
 *   - @c SteadyScheduler: std::chrono::steady_clock, polled by the host.
 *
 * Tasks run on the thread that drives the scheduler, one at a time, in
 * deadline order. A task may register or cancel timers, including its own.
 */
class IScheduler
{
public:
    virtual ~IScheduler() = default;

    /** @brief Current local time in milliseconds. */
    [[nodiscard]] virtual core::Millis now() const = 0;

    /**
     * @brief Runs @p task once, @p delay milliseconds from now.
     * @return Handle usable with cancel().
     */
    virtual TimerId after(core::Millis delay, Task task) = 0;

    /**
     * @brief Runs @p task every @p period milliseconds, first firing one
     *        period from now.
     */
    virtual TimerId every(core::Millis period, Task task) = 0;

    /**
     * @brief Cancels a timer. Unknown or already fired ids are ignored.
     * @return @c true if a pending timer was removed.
     */
    virtual bool cancel(TimerId id) = 0;

    /** @brief @c true while @p id is still scheduled. */
    [[nodiscard]] virtual bool pending(TimerId id) const = 0;
};

} // namespace tether::time

#endif // TETHER_TIME_ISCHEDULER_HPP
