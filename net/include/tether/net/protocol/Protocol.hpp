/**
 * @file Protocol.hpp
 * @brief Relay wire protocol: message kinds and field names.
 *
 * Every frame is one JSON object whose "type" member selects the kind.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TETHER_NET_PROTOCOL_PROTOCOL_HPP
    #define TETHER_NET_PROTOCOL_PROTOCOL_HPP

#include <tether/core/Types.hpp>

#include <optional>
#include <string_view>

namespace tether::net::protocol {

/**
 * @enum MessageType
 * @brief Exhaustive list of message kinds understood by the client.
 */
enum class MessageType : core::u8
{
    State,
    Broadcast,
    Ping,
    Welcome,
    FullState,
    Join,
    Leave,
    Message,
    Pong
};

/** @brief Wire spelling of @p type. */
[[nodiscard]] constexpr std::string_view typeName(MessageType type) noexcept
{
    switch (type)
    {
        case MessageType::State:     return "state";
        case MessageType::Broadcast: return "broadcast";
        case MessageType::Ping:      return "ping";
        case MessageType::Welcome:   return "welcome";
        case MessageType::FullState: return "full_state";
        case MessageType::Join:      return "join";
        case MessageType::Leave:     return "leave";
        case MessageType::Message:   return "message";
        case MessageType::Pong:      return "pong";
    }
    return "";
}

/** @brief Inverse of typeName(); nullopt for kinds this client ignores. */
[[nodiscard]] constexpr std::optional<MessageType> parseType(std::string_view name) noexcept
{
    for (auto type : {MessageType::State, MessageType::Broadcast, MessageType::Ping,
                      MessageType::Welcome, MessageType::FullState, MessageType::Join,
                      MessageType::Leave, MessageType::Message, MessageType::Pong})
    {
        if (typeName(type) == name)
            return type;
    }
    return std::nullopt;
}

namespace field {

inline constexpr const char* kType        = "type";
inline constexpr const char* kData        = "data";
inline constexpr const char* kState       = "state";
inline constexpr const char* kPlayerId    = "playerId";
inline constexpr const char* kPlayerCount = "playerCount";
inline constexpr const char* kTick        = "tick";
inline constexpr const char* kFrom        = "from";
inline constexpr const char* kServerTime  = "serverTime";

} // namespace field

} // namespace tether::net::protocol

#endif // TETHER_NET_PROTOCOL_PROTOCOL_HPP
