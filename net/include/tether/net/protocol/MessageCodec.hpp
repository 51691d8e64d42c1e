/**
 * @file MessageCodec.hpp
 * @brief JSON encoding of outbound frames and validated decoding of
 *        inbound ones.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TETHER_NET_PROTOCOL_MESSAGECODEC_HPP
    #define TETHER_NET_PROTOCOL_MESSAGECODEC_HPP

#include <tether/net/protocol/Protocol.hpp>
#include <tether/core/Expected.hpp>

#include <json/value.h>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tether::net::protocol {

/** @brief welcome / full_state: every known peer record. */
struct FullStateMessage
{
    bool                       welcome{false};
    Json::Value                peers{Json::objectValue};
    std::optional<core::u32>   playerCount;
    std::optional<core::u64>   tick;
};

/** @brief One peer's latest public record. */
struct StateMessage
{
    std::string peerId;
    Json::Value data{Json::objectValue};
};

struct PeerJoinedMessage
{
    std::string              peerId;
    std::optional<core::u32> playerCount;
};

struct PeerLeftMessage
{
    std::string              peerId;
    std::optional<core::u32> playerCount;
};

/** @brief Application broadcast relayed from another peer. */
struct PeerDataMessage
{
    std::string from;
    Json::Value data;
};

struct PongMessage {};

/** @brief Well-formed frame of a kind this client does not handle. */
struct IgnoredMessage
{
    std::string type;
};

using InboundPayload = std::variant<
    FullStateMessage,
    StateMessage,
    PeerJoinedMessage,
    PeerLeftMessage,
    PeerDataMessage,
    PongMessage,
    IgnoredMessage>;

/**
 * @struct InboundMessage
 * @brief Decoded frame plus the relay timestamp every kind may carry.
 */
struct InboundMessage
{
    InboundPayload              payload;
    std::optional<core::Millis> serverTime;
};

/**
 * @class MessageCodec
 * @brief Stateless encoder/decoder for relay frames.
 */
class MessageCodec final
{
public:
    MessageCodec() = delete;

    /**
     * @brief Parses and validates one inbound frame.
     * @return kMalformedMessage for non-JSON text, non-object roots,
     *         a missing type, or missing required members.
     */
    [[nodiscard]] static core::Expected<InboundMessage> decode(std::string_view text);

    /** @brief {"type":"state","data":record} */
    [[nodiscard]] static std::string encodeState(const Json::Value& publicRecord);

    /** @brief {"type":"broadcast","data":data} */
    [[nodiscard]] static std::string encodeBroadcast(const Json::Value& data);

    /** @brief {"type":"ping"} */
    [[nodiscard]] static std::string encodePing();

    /**
     * @brief Compact serialization with sorted object keys.
     *
     * Equal values always yield byte-identical output, which is what the
     * change detection of the broadcaster relies on.
     */
    [[nodiscard]] static std::string serialize(const Json::Value& value);

    /** @brief Parses arbitrary JSON text (used for configuration files). */
    [[nodiscard]] static core::Expected<Json::Value> parse(std::string_view text);
};

} // namespace tether::net::protocol

#endif // TETHER_NET_PROTOCOL_MESSAGECODEC_HPP
