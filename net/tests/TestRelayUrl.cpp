/**
 * @file TestRelayUrl.cpp
 * @brief Unit tests for net::protocol::RelayUrl.
 */

#include <catch2/catch_test_macros.hpp>

#include "tether/net/protocol/RelayUrl.hpp"

namespace tether::net::protocol {

using session::JoinParams;
using session::RelayEndpoint;

TEST_CASE("RelayUrl maps http schemes to websocket schemes", "[net][url]")
{
    REQUIRE(RelayUrl::toWebSocketScheme("https://relay.example.com") == "wss://relay.example.com");
    REQUIRE(RelayUrl::toWebSocketScheme("http://localhost:8787") == "ws://localhost:8787");
    REQUIRE(RelayUrl::toWebSocketScheme("wss://already.example.com") == "wss://already.example.com");
}

TEST_CASE("RelayUrl percent-encodes like encodeURIComponent", "[net][url]")
{
    REQUIRE(RelayUrl::encodeComponent("room-1_a.b~") == "room-1_a.b~");
    REQUIRE(RelayUrl::encodeComponent("a b&c=d") == "a%20b%26c%3Dd");
    REQUIRE(RelayUrl::encodeComponent("caf\xC3\xA9") == "caf%C3%A9");
}

TEST_CASE("RelayUrl builds the connect URL", "[net][url]")
{
    const RelayEndpoint endpoint{"https://relay.example.com/", "my-game"};

    SECTION("minimal join")
    {
        const JoinParams params{"room 1", "p_abc", {}};
        REQUIRE(RelayUrl::build(endpoint, params)
                == "wss://relay.example.com/v1/connect/room%201?gameId=my-game&playerId=p_abc&create=false");
    }

    SECTION("create with room options")
    {
        JoinParams params{"ABC123", "p_abc", {}};
        params.options.create = true;
        params.options.maxPlayers = 8;
        params.options.isPublic = true;
        params.options.name = "Friday night";
        params.options.meta = Json::Value{Json::objectValue};
        params.options.meta["mode"] = "ctf";

        REQUIRE(RelayUrl::build(endpoint, params)
                == "wss://relay.example.com/v1/connect/ABC123?gameId=my-game&playerId=p_abc"
                   "&create=true&maxPlayers=8&public=true&name=Friday%20night"
                   "&meta=%7B%22mode%22%3A%22ctf%22%7D");
    }
}

} // namespace tether::net::protocol
