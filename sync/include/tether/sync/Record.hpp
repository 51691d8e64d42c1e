/**
 * @file Record.hpp
 * @brief Peer record type and field-wise blending.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_RECORD_HPP
    #define TETHER_SYNC_RECORD_HPP

#include <tether/core/Types.hpp>

#include <json/value.h>

#include <string>

namespace tether::sync {

/** @brief One peer's fields: a JSON object of name -> JSON value. */
using PeerRecord = Json::Value;

/** @brief Peer identifier as assigned by the relay. */
using PeerId = std::string;

/**
 * @brief Blends @p from toward @p to, field by field.
 *
 * A member that is a number on both sides becomes
 * from + (to - from) * @p t. Any other member takes the value of @p to once
 * @p t exceeds @p snapAfter and otherwise keeps the value of @p from. The
 * set of members follows the same switch: up to @p snapAfter it is the one
 * of @p from, past it the one of @p to. A negative @p snapAfter copies
 * non-numeric members and the shape of @p to immediately.
 *
 * Only top-level members are blended; nested objects and arrays are
 * treated as opaque values.
 */
[[nodiscard]] PeerRecord blend(const PeerRecord& from, const PeerRecord& to,
                               core::f64 t, core::f64 snapAfter);

/** @brief Numeric JSON value (integer or real, never boolean). */
[[nodiscard]] inline bool isNumber(const Json::Value& v) noexcept
{
    return v.isNumeric() && !v.isBool();
}

} // namespace tether::sync

#endif // TETHER_SYNC_RECORD_HPP
