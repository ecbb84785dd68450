#include <catch2/catch.hpp>

#include <string>

#include "logger.h"

TEST_CASE("Recent lines keep the last fifty messages", "[logger]")
{
    for (int i = 0; i < 60; ++i)
        Logger::instance().log(LogLevel::Debug, "tail line %d", i);

    std::vector<std::string> lines = Logger::instance().recentLines();
    REQUIRE(lines.size() == 50);
    CHECK(lines.front() == "[DEBUG] tail line 10");
    CHECK(lines.back() == "[DEBUG] tail line 59");
}

TEST_CASE("Lines filtered from stderr still reach the tail", "[logger]")
{
    // Tests run quiet, which keeps only errors on stderr
    Logger::instance().log(LogLevel::Verbose, "filtered %s", "message");
    CHECK(Logger::instance().recentLines().back() == "[VERBOSE] filtered message");
}

TEST_CASE("Oversized messages are truncated without throwing", "[logger]")
{
    std::string big(5000, 'x');
    CHECK_NOTHROW(Logger::instance().log(LogLevel::Warn, "%s", big.c_str()));

    std::string last = Logger::instance().recentLines().back();
    CHECK(last.size() == std::string("[WARN] ").size() + 1023);
    CHECK(last.compare(0, 7, "[WARN] ") == 0);
}
