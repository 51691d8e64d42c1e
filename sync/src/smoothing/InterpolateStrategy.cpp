/**
 * @file InterpolateStrategy.cpp
 * @brief InterpolateStrategy implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/smoothing/InterpolateStrategy.hpp>

namespace tether::sync::smoothing {

InterpolateStrategy::InterpolateStrategy(core::Millis interpolationDelay,
                                         core::Millis jitterBuffer,
                                         const PrivateFieldFilter& filter)
    : _interpolationDelay{interpolationDelay}, _jitterBuffer{jitterBuffer}, _filter{filter}
{}

void InterpolateStrategy::onRecord(Json::Value& collection, const PeerId& peer, PeerRecord record,
                                   core::Millis timestamp, core::Millis now)
{
    if (!collection.isMember(peer) && !tracks(peer))
    {
        prime(collection, peer, std::move(record), timestamp);
        return;
    }

    if (_jitterBuffer > 0.0)
    {
        _jitter.push(JitterItem{peer, now + _jitterBuffer, timestamp, std::move(record)});
        return;
    }
    _snapshots.push(peer, timestamp, std::move(record));
}

void InterpolateStrategy::prime(Json::Value& collection, const PeerId& peer, PeerRecord record,
                                core::Millis timestamp)
{
    _jitter.erase(peer);
    _snapshots.erase(peer);
    _snapshots.push(peer, timestamp, record);
    overwrite(collection, peer, std::move(record), _filter);
}

bool InterpolateStrategy::tracks(const PeerId& peer) const
{
    return _snapshots.contains(peer) || _jitter.holds(peer);
}

void InterpolateStrategy::forget(const PeerId& peer)
{
    _snapshots.erase(peer);
    _jitter.erase(peer);
}

void InterpolateStrategy::clear()
{
    _snapshots.clear();
    _jitter.clear();
}

void InterpolateStrategy::render(Json::Value& collection, core::Millis now)
{
    for (auto& item : _jitter.promote(now))
    {
        _snapshots.push(item.peerId, item.timestamp, std::move(item.record));
    }

    const core::Millis renderTime = now - _interpolationDelay;
    for (const auto& peer : _snapshots.peers())
    {
        const PeerRecord* live = collection.isMember(peer) ? &collection[peer] : nullptr;
        auto next = _snapshots.sample(peer, renderTime, live);
        if (!next)
            continue;

        if (live)
            _filter.restore(*next, *live);
        collection[peer] = std::move(*next);
    }
}

} // namespace tether::sync::smoothing
