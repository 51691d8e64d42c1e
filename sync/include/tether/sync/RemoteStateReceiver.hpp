/**
 * @file RemoteStateReceiver.hpp
 * @brief Applies other peers' records to the bound collection.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_REMOTESTATERECEIVER_HPP
    #define TETHER_SYNC_REMOTESTATERECEIVER_HPP

#include <tether/sync/smoothing/ISmoothingStrategy.hpp>
#include <tether/sync/StateAdapter.hpp>
#include <tether/core/NonCopyable.hpp>

#include <memory>

namespace tether::sync {

/**
 * @class RemoteStateReceiver
 * @brief Sole writer of remote entries in the peer collection.
 *
 * Inbound records are sanitized before they reach the smoothing strategy,
 * so another peer's private fields never enter the collection. Records
 * addressed to the local peer id are ignored. Every operation is a no-op
 * while the adapter is unbound.
 */
class RemoteStateReceiver final : public core::NonCopyable<RemoteStateReceiver>
{
public:
    RemoteStateReceiver(IStateAdapter& adapter, const PrivateFieldFilter& filter);

    /** @brief Installs the smoothing policy for the next session. */
    void setStrategy(std::unique_ptr<smoothing::ISmoothingStrategy> strategy);

    void setLocalPeer(PeerId peer);

    /**
     * @brief One peer update.
     * @param timestamp Local time the record describes.
     * @param now       Local receive time.
     */
    void applyState(const PeerId& peer, PeerRecord record, core::Millis timestamp, core::Millis now);

    /** @brief welcome / full_state: every record applied at once. */
    void applyFullState(const Json::Value& peers, core::Millis timestamp);

    /** @brief Peer departure: entry and smoothing state removed. */
    void removePeer(const PeerId& peer);

    /** @brief Deletes every entry except the local one and resets smoothing. */
    void clearRemote();

    /** @brief Render-cadence step of the smoothing strategy. */
    void render(core::Millis now);

    /** @brief Number of remote entries in the collection. */
    [[nodiscard]] core::usize remoteCount();

    [[nodiscard]] const smoothing::ISmoothingStrategy* strategy() const noexcept { return _strategy.get(); }
    [[nodiscard]] const PeerId& localPeer() const noexcept { return _localPeer; }

private:
    [[nodiscard]] bool accepts(const PeerId& peer) const noexcept;

    IStateAdapter&                                  _adapter;
    const PrivateFieldFilter&                       _filter;
    std::unique_ptr<smoothing::ISmoothingStrategy>  _strategy;
    PeerId                                          _localPeer;
};

} // namespace tether::sync

#endif // TETHER_SYNC_REMOTESTATERECEIVER_HPP
