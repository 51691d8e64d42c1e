/**
 * @file TestMessageCodec.cpp
 * @brief Unit tests for net::protocol::MessageCodec.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "tether/net/protocol/MessageCodec.hpp"

namespace tether::net::protocol {

TEST_CASE("MessageCodec encodes outbound frames compactly with sorted keys", "[net][codec]")
{
    Json::Value record{Json::objectValue};
    record["y"] = 2;
    record["x"] = 1;

    REQUIRE(MessageCodec::encodeState(record) == R"({"data":{"x":1,"y":2},"type":"state"})");
    REQUIRE(MessageCodec::encodePing() == R"({"type":"ping"})");

    Json::Value chat{Json::objectValue};
    chat["text"] = "hi";
    REQUIRE(MessageCodec::encodeBroadcast(chat) == R"({"data":{"text":"hi"},"type":"broadcast"})");
}

TEST_CASE("MessageCodec decodes peer state", "[net][codec]")
{
    auto decoded = MessageCodec::decode(
        R"({"type":"state","playerId":"p2","data":{"x":10,"y":20},"serverTime":1500})");
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->serverTime.has_value());
    REQUIRE_THAT(*decoded->serverTime, Catch::Matchers::WithinAbs(1500.0, 1e-9));

    const auto* state = std::get_if<StateMessage>(&decoded->payload);
    REQUIRE(state != nullptr);
    REQUIRE(state->peerId == "p2");
    REQUIRE(state->data["x"].asInt() == 10);
    REQUIRE(state->data["y"].asInt() == 20);
}

TEST_CASE("MessageCodec decodes full state", "[net][codec]")
{
    SECTION("full_state with peers and count")
    {
        auto decoded = MessageCodec::decode(
            R"({"type":"full_state","state":{"p2":{"x":1},"p3":{"x":2}},"playerCount":3,"tick":42})");
        REQUIRE(decoded.has_value());
        const auto* full = std::get_if<FullStateMessage>(&decoded->payload);
        REQUIRE(full != nullptr);
        REQUIRE_FALSE(full->welcome);
        REQUIRE(full->peers.size() == 2);
        REQUIRE(full->playerCount == 3u);
        REQUIRE(full->tick == 42u);
    }

    SECTION("welcome without state yields an empty collection")
    {
        auto decoded = MessageCodec::decode(R"({"type":"welcome"})");
        REQUIRE(decoded.has_value());
        const auto* full = std::get_if<FullStateMessage>(&decoded->payload);
        REQUIRE(full != nullptr);
        REQUIRE(full->welcome);
        REQUIRE(full->peers.isObject());
        REQUIRE(full->peers.empty());
    }

    SECTION("non-object state is malformed")
    {
        auto decoded = MessageCodec::decode(R"({"type":"full_state","state":[1,2]})");
        REQUIRE_FALSE(decoded.has_value());
        REQUIRE(decoded.error().code() == core::ErrorCode::kMalformedMessage);
    }
}

TEST_CASE("MessageCodec decodes membership and data frames", "[net][codec]")
{
    auto joined = MessageCodec::decode(R"({"type":"join","playerId":"p4","playerCount":4})");
    REQUIRE(joined.has_value());
    REQUIRE(std::get<PeerJoinedMessage>(joined->payload).peerId == "p4");
    REQUIRE(std::get<PeerJoinedMessage>(joined->payload).playerCount == 4u);

    auto left = MessageCodec::decode(R"({"type":"leave","playerId":"p4"})");
    REQUIRE(left.has_value());
    REQUIRE(std::get<PeerLeftMessage>(left->payload).peerId == "p4");
    REQUIRE_FALSE(std::get<PeerLeftMessage>(left->payload).playerCount.has_value());

    auto message = MessageCodec::decode(R"({"type":"message","from":"p2","data":{"emote":"wave"}})");
    REQUIRE(message.has_value());
    const auto& data = std::get<PeerDataMessage>(message->payload);
    REQUIRE(data.from == "p2");
    REQUIRE(data.data["emote"].asString() == "wave");

    auto pong = MessageCodec::decode(R"({"type":"pong"})");
    REQUIRE(pong.has_value());
    REQUIRE(std::holds_alternative<PongMessage>(pong->payload));
}

TEST_CASE("MessageCodec ignores unknown types", "[net][codec]")
{
    auto decoded = MessageCodec::decode(R"({"type":"host_changed","hostId":"p9"})");
    REQUIRE(decoded.has_value());
    const auto* ignored = std::get_if<IgnoredMessage>(&decoded->payload);
    REQUIRE(ignored != nullptr);
    REQUIRE(ignored->type == "host_changed");
}

TEST_CASE("MessageCodec rejects malformed frames", "[net][codec]")
{
    const char* frames[] = {
        "not json",
        "[1,2,3]",
        R"({"data":{}})",
        R"({"type":7})",
        R"({"type":"state","data":{"x":1}})",
        R"({"type":"state","playerId":"","data":{"x":1}})",
        R"({"type":"state","playerId":"p2","data":5})",
        R"({"type":"join"})",
        R"({"type":"message","data":{}})",
    };

    for (const char* frame : frames)
    {
        INFO(frame);
        auto decoded = MessageCodec::decode(frame);
        REQUIRE_FALSE(decoded.has_value());
        REQUIRE(decoded.error().code() == core::ErrorCode::kMalformedMessage);
    }
}

} // namespace tether::net::protocol
