/**
 * @file RelayUrl.hpp
 * @brief Builds the relay connection URL of a room join.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TETHER_NET_PROTOCOL_RELAYURL_HPP
    #define TETHER_NET_PROTOCOL_RELAYURL_HPP

#include <tether/net/session/JoinParams.hpp>

#include <string>
#include <string_view>

namespace tether::net::protocol {

/**
 * @class RelayUrl
 * @brief URL construction for the relay's connect endpoint.
 *
 * Layout: <ws|wss>://host[/prefix]/v1/connect/<roomId>?gameId=..&playerId=..
 * followed by create, maxPlayers, public, name and meta when set. Every
 * path segment and query value is percent-encoded; meta is JSON-encoded
 * first.
 */
class RelayUrl final
{
public:
    RelayUrl() = delete;

    [[nodiscard]] static std::string build(const session::RelayEndpoint& endpoint,
                                           const session::JoinParams& params);

    /** @brief http:// -> ws://, https:// -> wss://, other schemes unchanged. */
    [[nodiscard]] static std::string toWebSocketScheme(std::string_view url);

    /** @brief Percent-encodes everything but A-Z a-z 0-9 - _ . ! ~ * ' ( ) */
    [[nodiscard]] static std::string encodeComponent(std::string_view text);
};

} // namespace tether::net::protocol

#endif // TETHER_NET_PROTOCOL_RELAYURL_HPP
