/**
 * @file Config.hpp
 * @brief Sync engine configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_CONFIG_HPP
    #define TETHER_SYNC_CONFIG_HPP

#include <tether/core/Constants.hpp>
#include <tether/core/Expected.hpp>
#include <tether/core/Types.hpp>

#include <json/value.h>

#include <string>
#include <string_view>

namespace tether::sync {

/**
 * @enum SmoothingMode
 * @brief How remote records are reconciled with the rendered ones.
 */
enum class SmoothingMode : core::u8
{
    None,
    Lerp,
    Interpolate
};

[[nodiscard]] std::string_view toString(SmoothingMode mode) noexcept;
[[nodiscard]] core::Expected<SmoothingMode> parseSmoothingMode(std::string_view name);

/** @brief Immutable sync configuration. */
class Config
{
public:
    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        Builder& tickRate(core::u32 hz) noexcept;
        Builder& renderRate(core::u32 hz) noexcept;
        Builder& smoothing(SmoothingMode mode) noexcept;
        Builder& lerpFactor(core::f64 factor) noexcept;
        Builder& interpolationDelay(core::Millis ms) noexcept;
        Builder& jitterBuffer(core::Millis ms) noexcept;
        Builder& pingInterval(core::Millis ms) noexcept;
        Builder& connectTimeout(core::Millis ms) noexcept;
        Builder& autoReconnect(bool enabled) noexcept;
        Builder& maxReconnectAttempts(core::u32 n) noexcept;
        Builder& relayUrl(std::string url);
        Builder& gameId(std::string id);
        Builder& peerId(std::string id);

        /**
         * @brief Validates and produces the configuration.
         * @return kInvalidArgument for a zero rate, a lerp factor outside
         *         (0, 1], or a negative delay.
         */
        [[nodiscard]] core::Expected<Config> build() const;

    private:
        core::u32     _tickRate{core::kDefaultTickRate};
        core::u32     _renderRate{core::kDefaultRenderRate};
        SmoothingMode _smoothing{SmoothingMode::Lerp};
        core::f64     _lerpFactor{core::kDefaultLerpFactor};
        core::Millis  _interpolationDelay{core::kDefaultInterpolationDelay};
        core::Millis  _jitterBuffer{core::kDefaultJitterBuffer};
        core::Millis  _pingInterval{core::kDefaultPingInterval};
        core::Millis  _connectTimeout{core::kDefaultConnectTimeout};
        bool          _autoReconnect{core::kDefaultAutoReconnect};
        core::u32     _maxReconnectAttempts{core::kDefaultMaxReconnects};
        std::string   _relayUrl;
        std::string   _gameId;
        std::string   _peerId;
    };

    /**
     * @brief Reads options from a JSON object.
     *
     * Recognised members: tickRate, renderRate, smoothing, interpolate
     * (legacy boolean: true = interpolate, false = none), lerpFactor,
     * interpolationDelay, jitterBuffer, pingInterval, connectTimeout,
     * autoReconnect, maxReconnectAttempts, relayUrl, gameId, peerId.
     * Unknown members are ignored; mistyped ones are rejected.
     */
    [[nodiscard]] static core::Expected<Config> fromJson(const Json::Value& json);

    /** @brief Defaults only. */
    [[nodiscard]] static Config defaults();

    [[nodiscard]] core::u32     tickRate()             const noexcept { return _tickRate; }
    [[nodiscard]] core::u32     renderRate()           const noexcept { return _renderRate; }
    [[nodiscard]] SmoothingMode smoothing()            const noexcept { return _smoothing; }
    [[nodiscard]] core::f64     lerpFactor()           const noexcept { return _lerpFactor; }
    [[nodiscard]] core::Millis  interpolationDelay()   const noexcept { return _interpolationDelay; }
    [[nodiscard]] core::Millis  jitterBuffer()         const noexcept { return _jitterBuffer; }
    [[nodiscard]] core::Millis  pingInterval()         const noexcept { return _pingInterval; }
    [[nodiscard]] core::Millis  connectTimeout()       const noexcept { return _connectTimeout; }
    [[nodiscard]] bool          autoReconnect()        const noexcept { return _autoReconnect; }
    [[nodiscard]] core::u32     maxReconnectAttempts() const noexcept { return _maxReconnectAttempts; }
    [[nodiscard]] const std::string& relayUrl()        const noexcept { return _relayUrl; }
    [[nodiscard]] const std::string& gameId()          const noexcept { return _gameId; }
    [[nodiscard]] const std::string& peerId()          const noexcept { return _peerId; }

    /** @brief Broadcast period in milliseconds. */
    [[nodiscard]] core::Millis tickInterval()   const noexcept { return 1000.0 / _tickRate; }

    /** @brief Render/interpolation period in milliseconds. */
    [[nodiscard]] core::Millis renderInterval() const noexcept { return 1000.0 / _renderRate; }

private:
    friend class Builder;

    core::u32     _tickRate{core::kDefaultTickRate};
    core::u32     _renderRate{core::kDefaultRenderRate};
    SmoothingMode _smoothing{SmoothingMode::Lerp};
    core::f64     _lerpFactor{core::kDefaultLerpFactor};
    core::Millis  _interpolationDelay{core::kDefaultInterpolationDelay};
    core::Millis  _jitterBuffer{core::kDefaultJitterBuffer};
    core::Millis  _pingInterval{core::kDefaultPingInterval};
    core::Millis  _connectTimeout{core::kDefaultConnectTimeout};
    bool          _autoReconnect{core::kDefaultAutoReconnect};
    core::u32     _maxReconnectAttempts{core::kDefaultMaxReconnects};
    std::string   _relayUrl;
    std::string   _gameId;
    std::string   _peerId;
};

} // namespace tether::sync

#endif // TETHER_SYNC_CONFIG_HPP
