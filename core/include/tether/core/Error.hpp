/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the error codes raised by the sync engine and a lightweight
 * Error value type carrying the code, a human-readable message, and the
 * source location where the error was raised.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_ERROR_HPP
    #define TETHER_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace tether::core {

/**
 * @brief Error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kInvalidArgument,
    kInvalidState,
    kNotFound,
    kAlreadyExists,
    kTimeout,
    kOutOfRange,
    kNotSupported,

    kTransportError,
    kNotConnected,
    kMalformedMessage,
    kReconnectExhausted,

    kSerializationFailed,
    kInternalError,
};

/**
 * @brief Returns a stable, lowercase name for @p code (used in log lines).
 */
[[nodiscard]] constexpr std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::kNone:                return "none";
        case ErrorCode::kInvalidArgument:     return "invalid_argument";
        case ErrorCode::kInvalidState:        return "invalid_state";
        case ErrorCode::kNotFound:            return "not_found";
        case ErrorCode::kAlreadyExists:       return "already_exists";
        case ErrorCode::kTimeout:             return "timeout";
        case ErrorCode::kOutOfRange:          return "out_of_range";
        case ErrorCode::kNotSupported:        return "not_supported";
        case ErrorCode::kTransportError:      return "transport_error";
        case ErrorCode::kNotConnected:        return "not_connected";
        case ErrorCode::kMalformedMessage:    return "malformed_message";
        case ErrorCode::kReconnectExhausted:  return "reconnect_exhausted";
        case ErrorCode::kSerializationFailed: return "serialization_failed";
        case ErrorCode::kInternalError:       return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Error is a lightweight value type (no heap allocation for the message
 * if it fits in SSO). It is intended to be stored inside Expected<T>.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode           code()     const { return _code; }
    [[nodiscard]] const std::string & message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace tether::core

#endif // TETHER_CORE_ERROR_HPP
