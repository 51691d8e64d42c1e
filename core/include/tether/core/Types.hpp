/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every Tether module.
 *
 * Provides fixed-width integer aliases, floating-point aliases and the
 * millisecond duration type used by the scheduler and the sync engine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_TYPES_HPP
    #define TETHER_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace tether::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

/**
 * @brief Timestamps and durations in milliseconds.
 *
 * Local clocks, relay clocks and every configured delay are expressed in
 * this unit so that interpolation math never mixes scales.
 */
using Millis = f64;

} // namespace tether::core

#endif // TETHER_CORE_TYPES_HPP
