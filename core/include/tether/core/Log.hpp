/**
 * @file Log.hpp
 * @brief Logging facade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  Hosts embedding the sync
 * engine route messages into their own sink via Log::setLogger().
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_LOG_HPP
    #define TETHER_CORE_LOG_HPP

    #include "Expected.hpp"
    #include "Types.hpp"

    #include <string_view>

namespace tether::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kOff
};

/**
 * @brief Parses "debug", "info", "warn", "error" or "off".
 * @return The level, or kInvalidArgument for any other spelling.
 */
[[nodiscard]] Expected<LogLevel> parseLogLevel(std::string_view name);

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "Broadcaster", "Session").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging facade used throughout the engine.
 *
 * The engine is single-threaded; the installed ILogger is only ever called
 * from the thread that drives the scheduler.
 */
class Log final {
public:
    Log() = delete;

    /// @brief Installs @p logger, or restores the stderr sink when null.
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    /// @brief True when a message at @p level would reach the sink.
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);

    /// @brief Logs @p err as "<code>: <message>" at error level.
    static void error(std::string_view tag, const Error &err);
};

} // namespace tether::core

#endif // TETHER_CORE_LOG_HPP
