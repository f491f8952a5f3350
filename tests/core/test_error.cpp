// fixi_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <fixiplug/core/error.hpp>
#include <string>
#include <vector>

using namespace fixi_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("hook", "beforeRequest");
        auto* ctx = err.get_context("hook");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "beforeRequest");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("PluginError::not_found") {
        Error err = PluginError::not_found("logger");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.is<PluginError>());
        REQUIRE(err.as<PluginError>()->plugin_id == "logger");
        REQUIRE(err.message().find("logger") != std::string::npos);
    }

    SECTION("PluginError::already_registered") {
        Error err = PluginError::already_registered("logger");
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
    }

    SECTION("PluginError::setup_failed") {
        Error err = PluginError::setup_failed("logger", "boom");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.as<PluginError>()->reason == "boom");
    }

    SECTION("SkillError::invalid") {
        Error err = SkillError::invalid("missing name");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.is<SkillError>());
        REQUIRE_FALSE(err.is<PluginError>());
    }

    SECTION("ConfigError kinds") {
        REQUIRE(Error(ConfigError::parse("x")).code() == ErrorCode::ParseError);
        REQUIRE(Error(ConfigError::invalid_value("batch_size", "zero")).code() == ErrorCode::ValidationError);
        REQUIRE(Error(ConfigError::io("/nope.json")).code() == ErrorCode::IOError);
    }
}

TEST_CASE("build_error_chain", "[core][error]") {
    Error err = PluginError::not_found("logger");
    err.with_context("operation", "enable");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[NotFound]") != std::string::npos);
    REQUIRE(chain.find("[PluginError]") != std::string::npos);
    REQUIRE(chain.find("(plugin: logger)") != std::string::npos);
    REQUIRE(chain.find("{operation=\"enable\"}") != std::string::npos);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with typed error") {
        Result<void> r = Err(SkillError::not_found("parse-html"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }

    SECTION("Err with Error object") {
        Error err(ErrorCode::NotFound, "Not found");
        Result<int> r = Err<int>(err);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(7) == 7);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("broken"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);
    }

    SECTION("unwrap on void Err throws") {
        Result<void> r = Err(PluginError::invalid("null plugin"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err keeps the error") {
        Result<int> r = Err<int>(Error(ErrorCode::InvalidState, "error"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::InvalidState);
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == "42");
    }

    SECTION("vector in result") {
        Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
        REQUIRE(r->size() == 3);
    }
}
