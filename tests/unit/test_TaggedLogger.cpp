#include <doctest/doctest.h>

#include "rtk/log/TaggedLogger.hpp"

#include <cstdlib>

using namespace RTK;

TEST_CASE("Log level names parse back to levels") {
    for (auto level : {LogLevel::Debug2, LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error,
                       LogLevel::Critical}) {
        auto parsed = parseLogLevel(logLevelName(level));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == level);
    }
    CHECK(parseLogLevel(" warn ") == LogLevel::Warning);
    CHECK(parseLogLevel("10") == LogLevel::Debug);
    CHECK_FALSE(parseLogLevel("loud").has_value());
    CHECK_FALSE(parseLogLevel("").has_value());
}

TEST_CASE("Logger defaults to warnings when no level is configured") {
    if (std::getenv("RTK_LOG_LEVEL") != nullptr) {
        return;
    }
    TaggedLogger fresh;
    CHECK(fresh.level() == LogLevel::Warning);
    CHECK(fresh.level() == kDefaultLogLevel);
}

TEST_CASE("Logger filters by level and enable flag") {
    auto& log = logger();
    auto const saved = log.level();

    log.setLoggingEnabled(true);
    log.setLevel(LogLevel::Warning);
    CHECK(log.enabledFor(LogLevel::Error));
    CHECK(log.enabledFor(LogLevel::Warning));
    CHECK_FALSE(log.enabledFor(LogLevel::Debug));

    log.setLevel(LogLevel::Debug);
    CHECK(log.enabledFor(LogLevel::Debug));
    CHECK_FALSE(log.enabledFor(LogLevel::Debug2));

    log.setLoggingEnabled(false);
    CHECK_FALSE(log.enabledFor(LogLevel::Critical));

    rtk_log_warning("dropped while disabled", "test");
    log.flush();
    log.setLevel(saved);
}
