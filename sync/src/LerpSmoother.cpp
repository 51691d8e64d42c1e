/**
 * @file LerpSmoother.cpp
 * @brief LerpSmoother implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/LerpSmoother.hpp>

namespace tether::sync {

LerpSmoother::LerpSmoother(core::f64 factor)
    : _factor{factor}
{}

void LerpSmoother::setTarget(const PeerId& peer, PeerRecord target)
{
    _targets.insert_or_assign(peer, std::move(target));
}

const PeerRecord* LerpSmoother::target(const PeerId& peer) const
{
    const auto it = _targets.find(peer);
    return it == _targets.end() ? nullptr : &it->second;
}

bool LerpSmoother::hasTarget(const PeerId& peer) const
{
    return _targets.contains(peer);
}

void LerpSmoother::tick(Json::Value& collection, const PrivateFieldFilter& filter) const
{
    if (!collection.isObject())
        return;

    for (const auto& [peer, target] : _targets)
    {
        if (!collection.isMember(peer))
        {
            collection[peer] = target;
            continue;
        }

        Json::Value& live = collection[peer];
        PeerRecord next = blend(live, target, _factor, -1.0);
        filter.restore(next, live);
        live = std::move(next);
    }
}

void LerpSmoother::erase(const PeerId& peer)
{
    _targets.erase(peer);
}

} // namespace tether::sync
