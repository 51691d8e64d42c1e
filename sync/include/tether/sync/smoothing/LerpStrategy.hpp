/**
 * @file LerpStrategy.hpp
 * @brief Smoothing mode "lerp".
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_SMOOTHING_LERPSTRATEGY_HPP
    #define TETHER_SYNC_SMOOTHING_LERPSTRATEGY_HPP

#include <tether/sync/smoothing/ISmoothingStrategy.hpp>
#include <tether/sync/LerpSmoother.hpp>

namespace tether::sync::smoothing {

/**
 * @class LerpStrategy
 * @brief Updates only the peer's target; the render tick moves the live
 *        entry through a LerpSmoother.
 */
class LerpStrategy final : public ISmoothingStrategy
{
public:
    LerpStrategy(core::f64 factor, const PrivateFieldFilter& filter);

    void onRecord(Json::Value& collection, const PeerId& peer, PeerRecord record,
                  core::Millis timestamp, core::Millis now) override;
    void prime(Json::Value& collection, const PeerId& peer, PeerRecord record,
               core::Millis timestamp) override;
    [[nodiscard]] bool tracks(const PeerId& peer) const override;
    void forget(const PeerId& peer) override;
    void clear() override;
    void render(Json::Value& collection, core::Millis now) override;
    [[nodiscard]] const char* name() const noexcept override { return "lerp"; }

    [[nodiscard]] const LerpSmoother& smoother() const noexcept { return _smoother; }

private:
    LerpSmoother              _smoother;
    const PrivateFieldFilter& _filter;
};

} // namespace tether::sync::smoothing

#endif // TETHER_SYNC_SMOOTHING_LERPSTRATEGY_HPP
