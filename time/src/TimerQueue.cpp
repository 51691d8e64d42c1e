/**
 * @file TimerQueue.cpp
 * @brief TimerQueue implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/time/TimerQueue.hpp>
#include <tether/core/Log.hpp>

#include <exception>
#include <string>

namespace tether::time {

TimerId TimerQueue::after(core::Millis delay, Task task)
{
    return schedule(now() + (delay > 0.0 ? delay : 0.0), 0.0, std::move(task));
}

TimerId TimerQueue::every(core::Millis period, Task task)
{
    if (period <= 0.0)
    {
        core::Log::warn("Scheduler", "rejected periodic timer with non-positive period");
        return kInvalidTimer;
    }
    return schedule(now() + period, period, std::move(task));
}

bool TimerQueue::cancel(TimerId id)
{
    return _timers.erase(id) > 0;
}

bool TimerQueue::pending(TimerId id) const
{
    return _timers.contains(id);
}

core::usize TimerQueue::size() const noexcept
{
    return _timers.size();
}

std::optional<core::Millis> TimerQueue::nextDeadline() const
{
    std::optional<core::Millis> earliest;
    for (const auto& [id, entry] : _timers)
    {
        if (!earliest || entry.deadline < *earliest)
            earliest = entry.deadline;
    }
    return earliest;
}

core::Millis TimerQueue::followingDeadline(core::Millis deadline, core::Millis period) const
{
    return deadline + period;
}

TimerId TimerQueue::schedule(core::Millis deadline, core::Millis period, Task task)
{
    if (!task)
        return kInvalidTimer;

    const TimerId id = _nextId++;
    _timers.emplace(id, Entry{deadline, period, std::move(task)});
    return id;
}

core::u32 TimerQueue::runDue(core::Millis until)
{
    core::u32 fired = 0;

    for (;;)
    {
        auto next = _timers.end();
        for (auto it = _timers.begin(); it != _timers.end(); ++it)
        {
            if (it->second.deadline > until)
                continue;
            if (next == _timers.end() || it->second.deadline < next->second.deadline)
                next = it;
        }
        if (next == _timers.end())
            break;

        const core::Millis deadline = next->second.deadline;
        // Copied: the task may cancel its own entry.
        Task task = next->second.task;

        if (next->second.period > 0.0)
            next->second.deadline = followingDeadline(deadline, next->second.period);
        else
            _timers.erase(next);

        onFire(deadline);
        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            core::Log::error("Scheduler", std::string{"timer task threw: "} + e.what());
        }
        ++fired;
    }

    return fired;
}

} // namespace tether::time
