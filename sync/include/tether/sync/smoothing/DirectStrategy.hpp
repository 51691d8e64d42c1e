/**
 * @file DirectStrategy.hpp
 * @brief Smoothing mode "none": remote records replace entries wholesale.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_SMOOTHING_DIRECTSTRATEGY_HPP
    #define TETHER_SYNC_SMOOTHING_DIRECTSTRATEGY_HPP

#include <tether/sync/smoothing/ISmoothingStrategy.hpp>

namespace tether::sync::smoothing {

class DirectStrategy final : public ISmoothingStrategy
{
public:
    explicit DirectStrategy(const PrivateFieldFilter& filter);

    void onRecord(Json::Value& collection, const PeerId& peer, PeerRecord record,
                  core::Millis timestamp, core::Millis now) override;
    void prime(Json::Value& collection, const PeerId& peer, PeerRecord record,
               core::Millis timestamp) override;
    [[nodiscard]] bool tracks(const PeerId&) const override { return false; }
    void forget(const PeerId&) override {}
    void clear() override {}
    void render(Json::Value&, core::Millis) override {}
    [[nodiscard]] const char* name() const noexcept override { return "none"; }

private:
    const PrivateFieldFilter& _filter;
};

} // namespace tether::sync::smoothing

#endif // TETHER_SYNC_SMOOTHING_DIRECTSTRATEGY_HPP
