/**
 * @file JitterQueue.cpp
 * @brief JitterQueue implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/JitterQueue.hpp>

#include <algorithm>

namespace tether::sync {

void JitterQueue::push(JitterItem item)
{
    _items.push_back(std::move(item));
}

std::vector<JitterItem> JitterQueue::promote(core::Millis now)
{
    std::vector<JitterItem> due;
    for (auto it = _items.begin(); it != _items.end();)
    {
        if (it->deliverAt <= now)
        {
            due.push_back(std::move(*it));
            it = _items.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return due;
}

bool JitterQueue::holds(const PeerId& peer) const
{
    return std::any_of(_items.begin(), _items.end(),
                       [&peer](const JitterItem& item) { return item.peerId == peer; });
}

void JitterQueue::erase(const PeerId& peer)
{
    _items.erase(std::remove_if(_items.begin(), _items.end(),
                                [&peer](const JitterItem& item) { return item.peerId == peer; }),
                 _items.end());
}

} // namespace tether::sync
