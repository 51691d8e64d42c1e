/**
 * @file LerpStrategy.cpp
 * @brief LerpStrategy implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/smoothing/LerpStrategy.hpp>

namespace tether::sync::smoothing {

LerpStrategy::LerpStrategy(core::f64 factor, const PrivateFieldFilter& filter)
    : _smoother{factor}, _filter{filter}
{}

void LerpStrategy::onRecord(Json::Value& collection, const PeerId& peer, PeerRecord record,
                            core::Millis timestamp, core::Millis /*now*/)
{
    if (!collection.isMember(peer))
    {
        prime(collection, peer, std::move(record), timestamp);
        return;
    }
    _smoother.setTarget(peer, std::move(record));
}

void LerpStrategy::prime(Json::Value& collection, const PeerId& peer, PeerRecord record,
                         core::Millis /*timestamp*/)
{
    _smoother.setTarget(peer, record);
    overwrite(collection, peer, std::move(record), _filter);
}

bool LerpStrategy::tracks(const PeerId& peer) const
{
    return _smoother.hasTarget(peer);
}

void LerpStrategy::forget(const PeerId& peer)
{
    _smoother.erase(peer);
}

void LerpStrategy::clear()
{
    _smoother.clear();
}

void LerpStrategy::render(Json::Value& collection, core::Millis /*now*/)
{
    _smoother.tick(collection, _filter);
}

} // namespace tether::sync::smoothing
