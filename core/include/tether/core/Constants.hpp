/**
 * @file Constants.hpp
 * @brief Compile-time defaults of the sync engine.
 *
 * Every tunable the relay protocol or the smoothing pipeline depends on is
 * centralised here; sync::Config starts from these values.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_CONSTANTS_HPP
    #define TETHER_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace tether::core {

inline constexpr u32    kDefaultTickRate           = 20;
inline constexpr u32    kDefaultRenderRate         = 60;
inline constexpr f64    kDefaultLerpFactor         = 0.15;
inline constexpr Millis kDefaultInterpolationDelay = 100.0;
inline constexpr Millis kDefaultJitterBuffer       = 0.0;
inline constexpr Millis kDefaultPingInterval       = 2'000.0;
inline constexpr Millis kDefaultConnectTimeout     = 10'000.0;

inline constexpr bool   kDefaultAutoReconnect      = true;
inline constexpr u32    kDefaultMaxReconnects      = 10;
inline constexpr Millis kReconnectBaseDelay        = 1'000.0;
inline constexpr Millis kReconnectMaxDelay         = 30'000.0;

inline constexpr usize  kSnapshotCapacity          = 10;
inline constexpr f64    kExtrapolationNudge        = 0.3;
inline constexpr f64    kClockOffsetAlpha          = 0.125;

inline constexpr usize  kRoomCodeLength            = 6;
inline constexpr usize  kPeerIdSuffixLength        = 9;

} // namespace tether::core

#endif // TETHER_CORE_CONSTANTS_HPP
