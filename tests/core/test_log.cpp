// fixi_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <fixiplug/core/log.hpp>

using namespace fixi_core;

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());
}

TEST_CASE("log_level_name", "[core][log]") {
    REQUIRE(std::string(log_level_name(spdlog::level::info)) == "info");
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns the same logger") {
        auto a = get_logger("test.named");
        auto b = get_logger("test.named");
        REQUIRE(a == b);
        REQUIRE(a->name() == "test.named");
    }

    SECTION("subsystem loggers") {
        REQUIRE(hooks_logger()->name() == "hooks");
        REQUIRE(plugin_logger()->name() == "plugins");
        REQUIRE(skills_logger()->name() == "skills");
    }

    SECTION("per-logger level") {
        auto logger = get_logger("test.level");
        set_logger_level("test.level", spdlog::level::err);
        REQUIRE(logger->level() == spdlog::level::err);
    }
}

TEST_CASE("Global log level", "[core][log]") {
    auto previous = get_global_log_level();

    set_global_log_level(spdlog::level::warn);
    REQUIRE(get_global_log_level() == spdlog::level::warn);
    REQUIRE(hooks_logger()->level() == spdlog::level::warn);

    set_global_log_level(previous);
}
