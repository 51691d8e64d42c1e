/**
 * @file SteadyScheduler.cpp
 * @brief SteadyScheduler implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/time/SteadyScheduler.hpp>
#include <tether/core/Log.hpp>

#include <thread>

namespace tether::time {

SteadyScheduler::SteadyScheduler()
    : _epoch{Clock::now()}
{}

core::Millis SteadyScheduler::now() const
{
    return std::chrono::duration<core::Millis, std::milli>(Clock::now() - _epoch).count();
}

core::u32 SteadyScheduler::poll()
{
    return runDue(now());
}

void SteadyScheduler::run()
{
    _running = true;

    while (_running)
    {
        poll();

        const auto deadline = nextDeadline();
        if (!deadline)
            break;

        if (_running)
        {
            const auto wakeAt = _epoch + std::chrono::duration_cast<Clock::duration>(
                std::chrono::duration<core::Millis, std::milli>(*deadline));
            std::this_thread::sleep_until(wakeAt);
        }
    }

    _running = false;
    core::Log::debug("Scheduler", "run loop stopped");
}

void SteadyScheduler::requestStop() noexcept
{
    _running = false;
}

core::Millis SteadyScheduler::followingDeadline(core::Millis deadline, core::Millis period) const
{
    const core::Millis current = now();
    core::Millis next = deadline + period;
    if (next <= current)
        next = current + period;
    return next;
}

} // namespace tether::time
