/**
 * @file MessageCodec.cpp
 * @brief MessageCodec implementation on jsoncpp.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/net/protocol/MessageCodec.hpp>

#include <json/reader.h>
#include <json/writer.h>

#include <memory>

namespace tether::net::protocol {

namespace {

core::Unexpected malformed(std::string what)
{
    return core::makeError(core::ErrorCode::kMalformedMessage, std::move(what));
}

const Json::StreamWriterBuilder& compactWriter()
{
    static const Json::StreamWriterBuilder builder = [] {
        Json::StreamWriterBuilder b;
        b["indentation"] = "";
        b["commentStyle"] = "None";
        b["emitUTF8"] = true;
        return b;
    }();
    return builder;
}

std::optional<core::u32> optionalCount(const Json::Value& root)
{
    const Json::Value& count = root[field::kPlayerCount];
    if (count.isUInt())
        return count.asUInt();
    return std::nullopt;
}

core::Expected<std::string> requireString(const Json::Value& root, const char* name,
                                          std::string_view type)
{
    const Json::Value& member = root[name];
    if (!member.isString() || member.asString().empty())
    {
        return malformed(std::string{type} + " message without a string '" + name + "'");
    }
    return member.asString();
}

core::Expected<InboundPayload> decodePayload(MessageType type, const Json::Value& root)
{
    switch (type)
    {
        case MessageType::Welcome:
        case MessageType::FullState:
        {
            FullStateMessage msg;
            msg.welcome = type == MessageType::Welcome;
            const Json::Value& state = root[field::kState];
            if (!state.isNull())
            {
                if (!state.isObject())
                    return malformed("full state payload is not an object");
                msg.peers = state;
            }
            msg.playerCount = optionalCount(root);
            if (root[field::kTick].isUInt64())
                msg.tick = root[field::kTick].asUInt64();
            return msg;
        }
        case MessageType::State:
        {
            StateMessage msg;
            msg.peerId = TETHER_TRY(requireString(root, field::kPlayerId, "state"));
            const Json::Value& data = root[field::kData];
            if (!data.isObject())
                return malformed("state message without an object 'data'");
            msg.data = data;
            return msg;
        }
        case MessageType::Join:
        {
            PeerJoinedMessage msg;
            msg.peerId = TETHER_TRY(requireString(root, field::kPlayerId, "join"));
            msg.playerCount = optionalCount(root);
            return msg;
        }
        case MessageType::Leave:
        {
            PeerLeftMessage msg;
            msg.peerId = TETHER_TRY(requireString(root, field::kPlayerId, "leave"));
            msg.playerCount = optionalCount(root);
            return msg;
        }
        case MessageType::Message:
        {
            PeerDataMessage msg;
            msg.from = TETHER_TRY(requireString(root, field::kFrom, "message"));
            msg.data = root[field::kData];
            return msg;
        }
        case MessageType::Pong:
            return PongMessage{};
        case MessageType::Broadcast:
        case MessageType::Ping:
            break;
    }
    return IgnoredMessage{std::string{typeName(type)}};
}

} // anonymous namespace

core::Expected<Json::Value> MessageCodec::parse(std::string_view text)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    const std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
    {
        return malformed("invalid JSON: " + errors);
    }
    return root;
}

core::Expected<InboundMessage> MessageCodec::decode(std::string_view text)
{
    const Json::Value root = TETHER_TRY(parse(text));

    if (!root.isObject())
        return malformed("frame is not a JSON object");

    const Json::Value& typeField = root[field::kType];
    if (!typeField.isString())
        return malformed("frame without a string 'type'");

    InboundMessage message{IgnoredMessage{typeField.asString()}, std::nullopt};

    const Json::Value& serverTime = root[field::kServerTime];
    if (serverTime.isNumeric())
        message.serverTime = serverTime.asDouble();

    const auto type = parseType(typeField.asString());
    if (!type)
        return message;

    message.payload = TETHER_TRY(decodePayload(*type, root));
    return message;
}

std::string MessageCodec::encodeState(const Json::Value& publicRecord)
{
    Json::Value root{Json::objectValue};
    root[field::kType] = std::string{typeName(MessageType::State)};
    root[field::kData] = publicRecord;
    return serialize(root);
}

std::string MessageCodec::encodeBroadcast(const Json::Value& data)
{
    Json::Value root{Json::objectValue};
    root[field::kType] = std::string{typeName(MessageType::Broadcast)};
    root[field::kData] = data;
    return serialize(root);
}

std::string MessageCodec::encodePing()
{
    Json::Value root{Json::objectValue};
    root[field::kType] = std::string{typeName(MessageType::Ping)};
    return serialize(root);
}

std::string MessageCodec::serialize(const Json::Value& value)
{
    return Json::writeString(compactWriter(), value);
}

} // namespace tether::net::protocol
