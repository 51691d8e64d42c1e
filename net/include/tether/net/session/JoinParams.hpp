/**
 * @file JoinParams.hpp
 * @brief Parameters of a room join, replayed verbatim on reconnection.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TETHER_NET_SESSION_JOINPARAMS_HPP
    #define TETHER_NET_SESSION_JOINPARAMS_HPP

#include <tether/core/Types.hpp>

#include <json/value.h>

#include <optional>
#include <string>

namespace tether::net::session {

/** @brief Room options forwarded to the relay as query parameters. */
struct JoinOptions
{
    bool                     create{false};
    std::optional<core::u32> maxPlayers;
    std::optional<bool>      isPublic;
    std::string              name;
    Json::Value              meta;
};

/** @brief Everything needed to (re)open a connection to one room. */
struct JoinParams
{
    std::string roomId;
    std::string peerId;
    JoinOptions options;
};

/** @brief Relay address and game scope shared by every connection. */
struct RelayEndpoint
{
    std::string baseUrl;
    std::string gameId;
};

} // namespace tether::net::session

#endif // TETHER_NET_SESSION_JOINPARAMS_HPP
