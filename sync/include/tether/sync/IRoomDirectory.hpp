/**
 * @file IRoomDirectory.hpp
 * @brief Optional collaborator listing the public rooms of a game.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_IROOMDIRECTORY_HPP
    #define TETHER_SYNC_IROOMDIRECTORY_HPP

#include <tether/core/Expected.hpp>
#include <tether/core/Types.hpp>

#include <json/value.h>

#include <optional>
#include <string>
#include <vector>

namespace tether::sync {

struct RoomInfo
{
    std::string              roomId;
    std::string              name;
    core::u32                playerCount{0};
    std::optional<core::u32> maxPlayers;
    bool                     isPublic{true};
    Json::Value              meta;
};

/**
 * @class IRoomDirectory
 * @brief Room listing service (typically an HTTP endpoint of the relay).
 */
class IRoomDirectory
{
public:
    virtual ~IRoomDirectory() = default;

    /**
     * @brief Fetches the rooms of @p gameId.
     * @param done Invoked exactly once, possibly before listRooms returns.
     */
    virtual void listRooms(const std::string& gameId,
                           core::Completion<std::vector<RoomInfo>> done) = 0;
};

} // namespace tether::sync

#endif // TETHER_SYNC_IROOMDIRECTORY_HPP
