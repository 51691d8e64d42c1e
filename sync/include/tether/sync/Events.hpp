/**
 * @file Events.hpp
 * @brief Typed notifications emitted by a StateBinding.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_EVENTS_HPP
    #define TETHER_SYNC_EVENTS_HPP

#include <tether/sync/Record.hpp>
#include <tether/core/Error.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace tether::sync {

namespace event {

/** @brief The first open of a join succeeded. */
struct Connected
{
    std::string roomId;
    PeerId      peerId;
};

/** @brief The session ended (leave, or closure without auto-reconnect). */
struct Disconnected {};

/** @brief A retry was scheduled after an unexpected closure. */
struct Reconnecting
{
    core::u32    attempt{0};
    core::Millis delayMs{0.0};
};

/** @brief A retry reopened the session. */
struct Reconnected {};

struct PeerJoined
{
    PeerId peerId;
};

struct PeerLeft
{
    PeerId peerId;
};

/** @brief Application data relayed from another peer. */
struct Message
{
    PeerId      from;
    Json::Value data;
};

struct Error
{
    core::Error error;
};

} // namespace event

using SyncEvent = std::variant<
    event::Connected,
    event::Disconnected,
    event::Reconnecting,
    event::Reconnected,
    event::PeerJoined,
    event::PeerLeft,
    event::Message,
    event::Error>;

/**
 * @enum EventKind
 * @brief Subscription key; the enumerators follow the SyncEvent order.
 */
enum class EventKind : core::u8
{
    Connected,
    Disconnected,
    Reconnecting,
    Reconnected,
    PeerJoined,
    PeerLeft,
    Message,
    Error,
    Count
};

[[nodiscard]] constexpr EventKind kindOf(const SyncEvent& event) noexcept
{
    return static_cast<EventKind>(event.index());
}

[[nodiscard]] std::string_view toString(EventKind kind) noexcept;

} // namespace tether::sync

#endif // TETHER_SYNC_EVENTS_HPP
