#include <catch2/catch_test_macros.hpp>

#include "toolhub/core/logger.hpp"

using toolhub::Logger;

TEST_CASE("Logger level names", "[core][logger]") {
    Logger::init("toolhub-test", "warn");
    CHECK(Logger::level() == "warning");

    CHECK(Logger::set_level("debug"));
    CHECK(Logger::level() == "debug");

    CHECK(Logger::set_level("off"));
    CHECK(Logger::level() == "off");

    CHECK_FALSE(Logger::set_level("chatty"));
    CHECK(Logger::level() == "info");

    Logger::init("toolhub", "info");
}
