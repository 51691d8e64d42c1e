/**
 * @file DirectStrategy.cpp
 * @brief DirectStrategy implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/smoothing/DirectStrategy.hpp>

namespace tether::sync::smoothing {

DirectStrategy::DirectStrategy(const PrivateFieldFilter& filter)
    : _filter{filter}
{}

void DirectStrategy::onRecord(Json::Value& collection, const PeerId& peer, PeerRecord record,
                              core::Millis /*timestamp*/, core::Millis /*now*/)
{
    overwrite(collection, peer, std::move(record), _filter);
}

void DirectStrategy::prime(Json::Value& collection, const PeerId& peer, PeerRecord record,
                           core::Millis /*timestamp*/)
{
    overwrite(collection, peer, std::move(record), _filter);
}

} // namespace tether::sync::smoothing
