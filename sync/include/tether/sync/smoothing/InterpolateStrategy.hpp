/**
 * @file InterpolateStrategy.hpp
 * @brief Smoothing mode "interpolate": delayed rendering between snapshots.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_SMOOTHING_INTERPOLATESTRATEGY_HPP
    #define TETHER_SYNC_SMOOTHING_INTERPOLATESTRATEGY_HPP

#include <tether/sync/smoothing/ISmoothingStrategy.hpp>
#include <tether/sync/JitterQueue.hpp>
#include <tether/sync/SnapshotBuffer.hpp>

namespace tether::sync::smoothing {

/**
 * @class InterpolateStrategy
 * @brief Buffers timestamped records and renders each peer at
 *        now - interpolationDelay.
 *
 * With a non-zero jitter buffer, records wait in a JitterQueue for that
 * long before entering the SnapshotBuffer. Promotion happens on the render
 * tick.
 */
class InterpolateStrategy final : public ISmoothingStrategy
{
public:
    InterpolateStrategy(core::Millis interpolationDelay, core::Millis jitterBuffer,
                        const PrivateFieldFilter& filter);

    void onRecord(Json::Value& collection, const PeerId& peer, PeerRecord record,
                  core::Millis timestamp, core::Millis now) override;
    void prime(Json::Value& collection, const PeerId& peer, PeerRecord record,
               core::Millis timestamp) override;
    [[nodiscard]] bool tracks(const PeerId& peer) const override;
    void forget(const PeerId& peer) override;
    void clear() override;
    void render(Json::Value& collection, core::Millis now) override;
    [[nodiscard]] const char* name() const noexcept override { return "interpolate"; }

    [[nodiscard]] const SnapshotBuffer& snapshots() const noexcept { return _snapshots; }
    [[nodiscard]] const JitterQueue& jitter() const noexcept { return _jitter; }

private:
    core::Millis              _interpolationDelay;
    core::Millis              _jitterBuffer;
    SnapshotBuffer            _snapshots;
    JitterQueue               _jitter;
    const PrivateFieldFilter& _filter;
};

} // namespace tether::sync::smoothing

#endif // TETHER_SYNC_SMOOTHING_INTERPOLATESTRATEGY_HPP
