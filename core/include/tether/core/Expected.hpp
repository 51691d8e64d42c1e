/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * TETHER_TRY macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_EXPECTED_HPP
    #define TETHER_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <functional>

namespace tether::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

/**
 * @brief Completion callback of an asynchronous operation.
 *
 * Invoked exactly once, from a scheduler or transport callback, with the
 * operation's outcome.
 */
template <typename T>
using Completion = std::function<void(Expected<T>)>;

} // namespace tether::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type tether::core::Expected<U>.
 */
#define TETHER_TRY(expr)                                                  \
    ({                                                                     \
        auto &&_tether_result = (expr);                                    \
        if (!_tether_result.has_value()) [[unlikely]]                      \
            return std::unexpected(std::move(_tether_result.error()));     \
        std::move(_tether_result.value());                                 \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type tether::core::ExpectedVoid.
 */
#define TETHER_TRY_VOID(expr)                                             \
    do {                                                                    \
        auto &&_tether_result = (expr);                                    \
        if (!_tether_result.has_value()) [[unlikely]]                      \
            return std::unexpected(std::move(_tether_result.error()));     \
    } while (false)

#endif // TETHER_CORE_EXPECTED_HPP
