#include <Lattice/Logging/Logger.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace Lattice::Logging;

namespace
{
    struct CapturedLog
    {
        std::vector<std::pair<LogLevel, std::string>> entries;

        static void Sink(void* userData, LogLevel level, std::string_view message)
        {
            static_cast<CapturedLog*>(userData)->entries.emplace_back(level, std::string(message));
        }
    };
}// namespace

TEST_CASE("Logger default instance is disabled", "[Logging][Logger]")
{
    constexpr Logger logger;
    STATIC_REQUIRE(logger.MinimumLevel() == LogLevel::Off);
    STATIC_REQUIRE_FALSE(logger.IsEnabled(LogLevel::Error));

    logger.Error("nothing {}", 1);
}

TEST_CASE("Logger filters below its minimum level", "[Logging][Logger]")
{
    CapturedLog  capture;
    const Logger logger {LogLevel::Warning, &CapturedLog::Sink, &capture};

    CHECK_FALSE(logger.IsEnabled(LogLevel::Info));
    CHECK(logger.IsEnabled(LogLevel::Warning));
    CHECK_FALSE(logger.IsEnabled(LogLevel::Off));

    logger.Debug("dropped");
    logger.Info("dropped {}", 2);
    logger.Warning("kept {} of {}", 1, 2);
    logger.Error("failed: {}", "disk");
    logger.Write(LogLevel::Trace, "dropped");

    REQUIRE(capture.entries.size() == 2);
    CHECK(capture.entries[0].first == LogLevel::Warning);
    CHECK(capture.entries[0].second == "kept 1 of 2");
    CHECK(capture.entries[1].first == LogLevel::Error);
    CHECK(capture.entries[1].second == "failed: disk");
}

TEST_CASE("Logger without a sink is disabled at every level", "[Logging][Logger]")
{
    const Logger logger {LogLevel::Trace, nullptr};
    CHECK_FALSE(logger.IsEnabled(LogLevel::Error));
    logger.Write(LogLevel::Error, "ignored");
}

TEST_CASE("Log tolerates a null logger", "[Logging][Logger]")
{
    CapturedLog  capture;
    const Logger logger {LogLevel::Trace, &CapturedLog::Sink, &capture};

    Log(nullptr, LogLevel::Error, "never {}", 0);
    Log(&logger, LogLevel::Trace, "seen {}", 42);

    REQUIRE(capture.entries.size() == 1);
    CHECK(capture.entries[0].second == "seen 42");
}

TEST_CASE("Logger::Stderr logs at Info and above", "[Logging][Logger]")
{
    const Logger& logger = Logger::Stderr();
    CHECK(logger.MinimumLevel() == LogLevel::Info);
    CHECK(logger.IsEnabled(LogLevel::Info));
    CHECK_FALSE(logger.IsEnabled(LogLevel::Debug));
    CHECK(&logger == &Logger::Stderr());
}

TEST_CASE("LogLevel names", "[Logging][Logger]")
{
    CHECK(ToString(LogLevel::Trace) == "Trace");
    CHECK(ToString(LogLevel::Warning) == "Warning");
    CHECK(ToString(LogLevel::Off) == "Off");
}
