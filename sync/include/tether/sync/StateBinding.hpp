/**
 * @file StateBinding.hpp
 * @brief Binds application state to a relay room.
 *
 * A StateBinding keeps the local peer's entry of the application's peer
 * collection published to the room, and applies every other peer's entry
 * as it arrives, smoothed according to the configured mode. All work runs
 * on the injected scheduler; no call blocks.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_STATEBINDING_HPP
    #define TETHER_SYNC_STATEBINDING_HPP

#include <tether/sync/Broadcaster.hpp>
#include <tether/sync/Config.hpp>
#include <tether/sync/EventChannel.hpp>
#include <tether/sync/IRoomDirectory.hpp>
#include <tether/sync/PrivateFieldFilter.hpp>
#include <tether/sync/StateAdapter.hpp>
#include <tether/net/session/JoinParams.hpp>
#include <tether/net/session/ReconnectionManager.hpp>
#include <tether/net/transport/ITransport.hpp>
#include <tether/time/IScheduler.hpp>
#include <tether/core/Expected.hpp>
#include <tether/core/NonCopyable.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tether::sync {

using net::session::ConnectionState;
using net::session::JoinOptions;

/**
 * @class StateBinding
 * @brief Room membership, state replication and reconnection for one
 *        application state object.
 *
 * The state object and the adapter must outlive the binding. The binding
 * writes only remote entries of the collection; the application owns its
 * own entry and edits it freely between ticks.
 */
class StateBinding final : public core::NonCopyable<StateBinding>
{
public:
    StateBinding(time::IScheduler& scheduler,
                 net::transport::ITransportFactory& transports,
                 IStateAdapter& adapter,
                 Config config,
                 IRoomDirectory* directory = nullptr);
    ~StateBinding();

    /**
     * @brief Enters @p roomId, leaving the current room first.
     *
     * @param done Completes once: success when the transport opens,
     *             kTimeout after the connect deadline, kTransportError when
     *             the transport fails, kInvalidState if leave() interrupts
     *             the join, kInvalidArgument for an empty room id.
     */
    void join(const std::string& roomId, JoinOptions options, core::Completion<void> done);

    /**
     * @brief Creates a room with a fresh 6-character code and joins it.
     * @param done Completes with the room code.
     */
    void create(JoinOptions options, core::Completion<std::string> done);

    /** @brief Leaves the room. Safe to call repeatedly and from callbacks. */
    void leave();

    /**
     * @brief Sends application data to every other peer.
     * @return kNotConnected unless the transport is open.
     */
    [[nodiscard]] core::Expected<void> broadcast(const Json::Value& data);

    /** @brief Publishes the local record now, even if unchanged. */
    BroadcastResult flush();

    SubscriptionId on(EventKind kind, EventHandler handler);
    bool off(SubscriptionId id);

    /** @brief kNotSupported when no room directory was supplied. */
    void listRooms(core::Completion<std::vector<RoomInfo>> done);

    [[nodiscard]] const PeerId&                    myId() const noexcept;
    [[nodiscard]] const std::optional<std::string>& roomId() const noexcept;
    [[nodiscard]] bool                             connected() const noexcept;

    /** @brief Relay-reported count when known, otherwise the collection size. */
    [[nodiscard]] core::u32                        playerCount() const;

    /** @brief Last measured round trip in milliseconds. */
    [[nodiscard]] core::Millis                     latency() const noexcept;
    [[nodiscard]] ConnectionState                  connectionState() const noexcept;

    /** @brief Outcome of the last peer collection lookup. */
    [[nodiscard]] const core::Expected<void>&      bindingStatus() const noexcept;

    /** @brief Estimated local minus relay clock, in milliseconds. */
    [[nodiscard]] core::Millis                     clockOffset() const noexcept;

    [[nodiscard]] const Config&                    config() const noexcept;

    /** @brief Visibility policy; fields marked here are never published. */
    [[nodiscard]] PrivateFieldFilter&              visibility() noexcept;

    /** @brief "p_" followed by 9 lowercase alphanumerics. */
    [[nodiscard]] static PeerId generatePeerId();

    /** @brief 6 characters from [A-Z0-9]. */
    [[nodiscard]] static std::string generateRoomCode();

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tether::sync

#endif // TETHER_SYNC_STATEBINDING_HPP
