// nitro_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <nitro/core/log.hpp>

using namespace nitro_core;

TEST_CASE("Log level parsing", "[core][log]") {
    SECTION("known names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("unknown name") {
        REQUIRE_FALSE(parse_log_level("loud").has_value());
    }

    SECTION("names round trip") {
        for (auto level : {spdlog::level::trace, spdlog::level::info, spdlog::level::critical}) {
            REQUIRE(parse_log_level(log_level_name(level)) == level);
        }
    }
}

TEST_CASE("Module loggers", "[core][log]") {
    SECTION("same name returns same logger") {
        auto a = get_logger("test_named");
        auto b = get_logger("test_named");
        REQUIRE(a == b);
        REQUIRE(a->name() == "test_named");
    }

    SECTION("package logger") {
        REQUIRE(pkg_logger()->name() == "pkg");
        REQUIRE(pkg_logger() == get_logger("pkg"));
    }

    SECTION("loggers share one sink") {
        auto a = get_logger("test_sink_a");
        auto b = get_logger("test_sink_b");
        REQUIRE(a->sinks().size() == 1);
        REQUIRE(a->sinks() == b->sinks());
    }
}

TEST_CASE("Log level management", "[core][log]") {
    auto previous = get_global_log_level();

    SECTION("global level applies to existing loggers") {
        auto logger = get_logger("test_levels");
        set_global_log_level(spdlog::level::warn);
        REQUIRE(get_global_log_level() == spdlog::level::warn);
        REQUIRE(logger->level() == spdlog::level::warn);
    }

    SECTION("global level applies to new loggers") {
        set_global_log_level(spdlog::level::err);
        REQUIRE(get_logger("test_late_logger")->level() == spdlog::level::err);
    }

    set_global_log_level(previous);
}

TEST_CASE("Log scopes", "[core][log]") {
    auto previous = get_global_log_level();
    set_global_log_level(spdlog::level::off);

    {
        NITRO_LOG_SCOPE("outer", "test_scope");
        NITRO_LOG_SCOPE("inner", "test_scope");
        get_logger("test_scope")->info("inside both scopes");
    }

    set_global_log_level(previous);
    SUCCEED();
}
