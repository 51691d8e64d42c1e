/**
 * @file Config.cpp
 * @brief Config::Builder and JSON loading.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/Config.hpp>

#include <functional>
#include <string>

namespace tether::sync {

namespace {

core::Unexpected invalid(std::string what)
{
    return core::makeError(core::ErrorCode::kInvalidArgument, std::move(what));
}

core::Expected<void> readUInt(const Json::Value& json, const char* key,
                              const std::function<void(core::u32)>& apply)
{
    if (!json.isMember(key))
        return {};
    if (!json[key].isUInt())
        return invalid(std::string{"'"} + key + "' must be a non-negative integer");
    apply(json[key].asUInt());
    return {};
}

core::Expected<void> readNumber(const Json::Value& json, const char* key,
                                const std::function<void(core::f64)>& apply)
{
    if (!json.isMember(key))
        return {};
    if (!json[key].isNumeric())
        return invalid(std::string{"'"} + key + "' must be a number");
    apply(json[key].asDouble());
    return {};
}

core::Expected<void> readBool(const Json::Value& json, const char* key,
                              const std::function<void(bool)>& apply)
{
    if (!json.isMember(key))
        return {};
    if (!json[key].isBool())
        return invalid(std::string{"'"} + key + "' must be a boolean");
    apply(json[key].asBool());
    return {};
}

core::Expected<void> readString(const Json::Value& json, const char* key,
                                const std::function<void(std::string)>& apply)
{
    if (!json.isMember(key))
        return {};
    if (!json[key].isString())
        return invalid(std::string{"'"} + key + "' must be a string");
    apply(json[key].asString());
    return {};
}

} // anonymous namespace

std::string_view toString(SmoothingMode mode) noexcept
{
    switch (mode)
    {
        case SmoothingMode::None:        return "none";
        case SmoothingMode::Lerp:        return "lerp";
        case SmoothingMode::Interpolate: return "interpolate";
    }
    return "unknown";
}

core::Expected<SmoothingMode> parseSmoothingMode(std::string_view name)
{
    if (name == "none")        return SmoothingMode::None;
    if (name == "lerp")        return SmoothingMode::Lerp;
    if (name == "interpolate") return SmoothingMode::Interpolate;
    return invalid("unknown smoothing mode '" + std::string{name} + "'");
}

Config::Builder& Config::Builder::tickRate(core::u32 hz) noexcept
{
    _tickRate = hz;
    return *this;
}

Config::Builder& Config::Builder::renderRate(core::u32 hz) noexcept
{
    _renderRate = hz;
    return *this;
}

Config::Builder& Config::Builder::smoothing(SmoothingMode mode) noexcept
{
    _smoothing = mode;
    return *this;
}

Config::Builder& Config::Builder::lerpFactor(core::f64 factor) noexcept
{
    _lerpFactor = factor;
    return *this;
}

Config::Builder& Config::Builder::interpolationDelay(core::Millis ms) noexcept
{
    _interpolationDelay = ms;
    return *this;
}

Config::Builder& Config::Builder::jitterBuffer(core::Millis ms) noexcept
{
    _jitterBuffer = ms;
    return *this;
}

Config::Builder& Config::Builder::pingInterval(core::Millis ms) noexcept
{
    _pingInterval = ms;
    return *this;
}

Config::Builder& Config::Builder::connectTimeout(core::Millis ms) noexcept
{
    _connectTimeout = ms;
    return *this;
}

Config::Builder& Config::Builder::autoReconnect(bool enabled) noexcept
{
    _autoReconnect = enabled;
    return *this;
}

Config::Builder& Config::Builder::maxReconnectAttempts(core::u32 n) noexcept
{
    _maxReconnectAttempts = n;
    return *this;
}

Config::Builder& Config::Builder::relayUrl(std::string url)
{
    _relayUrl = std::move(url);
    return *this;
}

Config::Builder& Config::Builder::gameId(std::string id)
{
    _gameId = std::move(id);
    return *this;
}

Config::Builder& Config::Builder::peerId(std::string id)
{
    _peerId = std::move(id);
    return *this;
}

core::Expected<Config> Config::Builder::build() const
{
    if (_tickRate == 0)
        return invalid("tickRate must be positive");
    if (_renderRate == 0)
        return invalid("renderRate must be positive");
    if (!(_lerpFactor > 0.0 && _lerpFactor <= 1.0))
        return invalid("lerpFactor must be in (0, 1]");
    if (_interpolationDelay < 0.0 || _jitterBuffer < 0.0)
        return invalid("interpolationDelay and jitterBuffer must not be negative");
    if (_pingInterval <= 0.0 || _connectTimeout <= 0.0)
        return invalid("pingInterval and connectTimeout must be positive");

    Config cfg;
    cfg._tickRate             = _tickRate;
    cfg._renderRate           = _renderRate;
    cfg._smoothing            = _smoothing;
    cfg._lerpFactor           = _lerpFactor;
    cfg._interpolationDelay   = _interpolationDelay;
    cfg._jitterBuffer         = _jitterBuffer;
    cfg._pingInterval         = _pingInterval;
    cfg._connectTimeout       = _connectTimeout;
    cfg._autoReconnect        = _autoReconnect;
    cfg._maxReconnectAttempts = _maxReconnectAttempts;
    cfg._relayUrl             = _relayUrl;
    cfg._gameId               = _gameId;
    cfg._peerId               = _peerId;
    return cfg;
}

Config Config::defaults()
{
    return Config{};
}

core::Expected<Config> Config::fromJson(const Json::Value& json)
{
    if (!json.isObject())
        return invalid("sync configuration must be a JSON object");

    Builder b;

    TETHER_TRY_VOID(readUInt(json, "tickRate", [&](core::u32 v) { b.tickRate(v); }));
    TETHER_TRY_VOID(readUInt(json, "renderRate", [&](core::u32 v) { b.renderRate(v); }));
    TETHER_TRY_VOID(readUInt(json, "maxReconnectAttempts", [&](core::u32 v) { b.maxReconnectAttempts(v); }));
    TETHER_TRY_VOID(readNumber(json, "lerpFactor", [&](core::f64 v) { b.lerpFactor(v); }));
    TETHER_TRY_VOID(readNumber(json, "interpolationDelay", [&](core::f64 v) { b.interpolationDelay(v); }));
    TETHER_TRY_VOID(readNumber(json, "jitterBuffer", [&](core::f64 v) { b.jitterBuffer(v); }));
    TETHER_TRY_VOID(readNumber(json, "pingInterval", [&](core::f64 v) { b.pingInterval(v); }));
    TETHER_TRY_VOID(readNumber(json, "connectTimeout", [&](core::f64 v) { b.connectTimeout(v); }));
    TETHER_TRY_VOID(readBool(json, "autoReconnect", [&](bool v) { b.autoReconnect(v); }));
    TETHER_TRY_VOID(readString(json, "relayUrl", [&](std::string v) { b.relayUrl(std::move(v)); }));
    TETHER_TRY_VOID(readString(json, "gameId", [&](std::string v) { b.gameId(std::move(v)); }));
    TETHER_TRY_VOID(readString(json, "peerId", [&](std::string v) { b.peerId(std::move(v)); }));

    TETHER_TRY_VOID(readBool(json, "interpolate", [&](bool v) {
        b.smoothing(v ? SmoothingMode::Interpolate : SmoothingMode::None);
    }));

    if (json.isMember("smoothing"))
    {
        if (!json["smoothing"].isString())
            return invalid("'smoothing' must be a string");
        b.smoothing(TETHER_TRY(parseSmoothingMode(json["smoothing"].asString())));
    }

    return b.build();
}

} // namespace tether::sync
