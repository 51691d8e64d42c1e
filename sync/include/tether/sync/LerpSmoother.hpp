/**
 * @file LerpSmoother.hpp
 * @brief Exponential approach of live records toward their latest target.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_LERPSMOOTHER_HPP
    #define TETHER_SYNC_LERPSMOOTHER_HPP

#include <tether/sync/PrivateFieldFilter.hpp>
#include <tether/core/Constants.hpp>

#include <unordered_map>

namespace tether::sync {

/**
 * @class LerpSmoother
 * @brief Moves each live record a fixed fraction of the way to its target
 *        on every tick.
 *
 * After n ticks a numeric field equals target - (target - initial)(1 - f)^n.
 * Non-numeric fields are copied on the first tick. Targets are kept until
 * the peer is erased, so a stalled peer converges onto its last record.
 */
class LerpSmoother final
{
public:
    explicit LerpSmoother(core::f64 factor = core::kDefaultLerpFactor);

    void setTarget(const PeerId& peer, PeerRecord target);

    [[nodiscard]] const PeerRecord* target(const PeerId& peer) const;
    [[nodiscard]] bool hasTarget(const PeerId& peer) const;

    /**
     * @brief Advances every live entry of @p collection by one step.
     *
     * An entry missing from the collection is recreated from its target.
     * Private fields already on a live entry are kept.
     */
    void tick(Json::Value& collection, const PrivateFieldFilter& filter) const;

    void erase(const PeerId& peer);
    void clear() noexcept { _targets.clear(); }

    [[nodiscard]] core::usize size() const noexcept { return _targets.size(); }
    [[nodiscard]] core::f64 factor() const noexcept { return _factor; }

private:
    core::f64 _factor;
    std::unordered_map<PeerId, PeerRecord> _targets;
};

} // namespace tether::sync

#endif // TETHER_SYNC_LERPSMOOTHER_HPP
