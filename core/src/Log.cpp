/**
 * @file Log.cpp
 * @brief Default ILogger implementation writing to stderr.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "tether/core/Log.hpp"

#include <cstdio>
#include <iterator>
#include <string>

namespace tether::core {

namespace {

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        static constexpr const char *kLevelNames[] = {
            "DEBUG", "INFO ", "WARN ", "ERROR"
        };
        const auto idx = static_cast<unsigned>(level);
        if (idx >= std::size(kLevelNames))
            return;
        std::fprintf(
            stderr,
            "[tether][%s][%.*s] %.*s\n",
            kLevelNames[idx],
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }
};

StderrLogger  gDefaultLogger;
ILogger      *gActiveLogger  = &gDefaultLogger;
LogLevel      gMinLevel      = LogLevel::kInfo;

void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (!Log::enabled(level))
        return;
    gActiveLogger->write(level, tag, msg);
}

} // anonymous namespace

Expected<LogLevel> parseLogLevel(std::string_view name)
{
    if (name == "debug") return LogLevel::kDebug;
    if (name == "info")  return LogLevel::kInfo;
    if (name == "warn")  return LogLevel::kWarn;
    if (name == "error") return LogLevel::kError;
    if (name == "off")   return LogLevel::kOff;
    return makeError(ErrorCode::kInvalidArgument,
                     "unknown log level '" + std::string{name} + "'");
}

void     Log::setLogger(ILogger *logger)  { gActiveLogger = logger ? logger : &gDefaultLogger; }
void     Log::setMinLevel(LogLevel level) { gMinLevel = level; }
LogLevel Log::minLevel()                  { return gMinLevel; }

bool Log::enabled(LogLevel level)
{
    return level != LogLevel::kOff && level >= gMinLevel;
}

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }

void Log::error(std::string_view tag, const Error &err)
{
    if (!enabled(LogLevel::kError))
        return;
    std::string line{toString(err.code())};
    line += ": ";
    line += err.message();
    gActiveLogger->write(LogLevel::kError, tag, line);
}

} // namespace tether::core
