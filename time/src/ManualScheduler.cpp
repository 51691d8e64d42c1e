/**
 * @file ManualScheduler.cpp
 * @brief ManualScheduler implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/time/ManualScheduler.hpp>

namespace tether::time {

ManualScheduler::ManualScheduler(core::Millis start)
    : _now{start}
{}

core::Millis ManualScheduler::now() const
{
    return _now;
}

core::u32 ManualScheduler::advance(core::Millis delta)
{
    const core::Millis target = _now + (delta > 0.0 ? delta : 0.0);
    const core::u32 fired = runDue(target);
    _now = target;
    return fired;
}

core::u32 ManualScheduler::runPending()
{
    return runDue(_now);
}

void ManualScheduler::onFire(core::Millis deadline)
{
    if (deadline > _now)
        _now = deadline;
}

} // namespace tether::time
