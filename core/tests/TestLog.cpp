/**
 * @file TestLog.cpp
 * @brief Unit tests for core::Log and core::parseLogLevel.
 */

#include <catch2/catch_test_macros.hpp>

#include "tether/core/Log.hpp"

#include <string>
#include <vector>

namespace tether::core {

namespace {

struct Entry
{
    LogLevel    level;
    std::string tag;
    std::string message;
};

class CaptureLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;
};

struct ScopedLogger
{
    explicit ScopedLogger(ILogger *logger, LogLevel level)
        : previous{Log::minLevel()}
    {
        Log::setLogger(logger);
        Log::setMinLevel(level);
    }

    ~ScopedLogger()
    {
        Log::setLogger(nullptr);
        Log::setMinLevel(previous);
    }

    LogLevel previous;
};

} // namespace

TEST_CASE("parseLogLevel accepts the five level names", "[core][log]")
{
    REQUIRE(parseLogLevel("debug").value() == LogLevel::kDebug);
    REQUIRE(parseLogLevel("info").value() == LogLevel::kInfo);
    REQUIRE(parseLogLevel("warn").value() == LogLevel::kWarn);
    REQUIRE(parseLogLevel("error").value() == LogLevel::kError);
    REQUIRE(parseLogLevel("off").value() == LogLevel::kOff);

    auto bad = parseLogLevel("verbose");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code() == ErrorCode::kInvalidArgument);
}

TEST_CASE("Log filters below the minimum level", "[core][log]")
{
    CaptureLogger capture;
    ScopedLogger scope{&capture, LogLevel::kWarn};

    Log::debug("Test", "hidden");
    Log::info("Test", "hidden");
    Log::warn("Test", "shown");
    Log::error("Test", "also shown");

    REQUIRE(capture.entries.size() == 2);
    REQUIRE(capture.entries[0].level == LogLevel::kWarn);
    REQUIRE(capture.entries[0].tag == "Test");
    REQUIRE(capture.entries[0].message == "shown");
    REQUIRE(capture.entries[1].level == LogLevel::kError);
}

TEST_CASE("Log at level off discards everything", "[core][log]")
{
    CaptureLogger capture;
    ScopedLogger scope{&capture, LogLevel::kOff};

    Log::error("Test", "dropped");
    REQUIRE(capture.entries.empty());
    REQUIRE_FALSE(Log::enabled(LogLevel::kError));
}

TEST_CASE("Log::error formats an Error with its code", "[core][log]")
{
    CaptureLogger capture;
    ScopedLogger scope{&capture, LogLevel::kDebug};

    Log::error("Session", Error{ErrorCode::kTimeout, "connection timed out"});

    REQUIRE(capture.entries.size() == 1);
    REQUIRE(capture.entries[0].tag == "Session");
    REQUIRE(capture.entries[0].message == "timeout: connection timed out");
}

TEST_CASE("makeError carries code and message", "[core][error]")
{
    Expected<int> result = makeError(ErrorCode::kNotConnected, "transport is not open");

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == ErrorCode::kNotConnected);
    REQUIRE(result.error().message() == "transport is not open");
    REQUIRE(toString(ErrorCode::kReconnectExhausted) == "reconnect_exhausted");
}

} // namespace tether::core
