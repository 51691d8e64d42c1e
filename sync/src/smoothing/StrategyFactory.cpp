/**
 * @file StrategyFactory.cpp
 * @brief Smoothing strategy selection and the shared overwrite helper.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/smoothing/DirectStrategy.hpp>
#include <tether/sync/smoothing/InterpolateStrategy.hpp>
#include <tether/sync/smoothing/LerpStrategy.hpp>

namespace tether::sync::smoothing {

std::unique_ptr<ISmoothingStrategy> makeStrategy(const Config& config,
                                                 const PrivateFieldFilter& filter)
{
    switch (config.smoothing())
    {
        case SmoothingMode::None:
            return std::make_unique<DirectStrategy>(filter);
        case SmoothingMode::Interpolate:
            return std::make_unique<InterpolateStrategy>(config.interpolationDelay(),
                                                         config.jitterBuffer(), filter);
        case SmoothingMode::Lerp:
        default:
            return std::make_unique<LerpStrategy>(config.lerpFactor(), filter);
    }
}

void overwrite(Json::Value& collection, const PeerId& peer, PeerRecord record,
               const PrivateFieldFilter& filter)
{
    if (collection.isMember(peer))
        filter.restore(record, collection[peer]);
    collection[peer] = std::move(record);
}

} // namespace tether::sync::smoothing
