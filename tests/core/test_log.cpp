/// @file test_log.cpp
/// @brief Tests for bindery_core logging setup

#include <catch2/catch.hpp>
#include <bindery/core/log.hpp>

using namespace bindery_core;

TEST_CASE("Logging: level parsing", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
    REQUIRE(std::string(log_level_name(spdlog::level::info)) == "info");
}

TEST_CASE("Logging: named loggers", "[core][log]") {
    SECTION("module loggers are distinct and cached") {
        auto bind = bind_logger();
        auto ui = ui_logger();
        REQUIRE(bind != nullptr);
        REQUIRE(ui != nullptr);
        REQUIRE(bind != ui);
        REQUIRE(bind_logger() == bind);
        REQUIRE(bind->name() == "bindery_bind");
    }

    SECTION("global level applies to existing loggers") {
        auto previous = get_global_log_level();

        set_global_log_level(spdlog::level::warn);
        REQUIRE(get_global_log_level() == spdlog::level::warn);
        REQUIRE(bind_logger()->level() == spdlog::level::warn);

        set_logger_level("bindery_bind", spdlog::level::trace);
        REQUIRE(bind_logger()->level() == spdlog::level::trace);

        set_global_log_level(previous);
    }
}

TEST_CASE("Logging: configure without sinks on disk", "[core][log]") {
    LogConfig config;
    config.console_enabled = false;
    config.file_enabled = false;
    config.level = spdlog::level::debug;

    configure_logging(config);
    REQUIRE(get_global_log_level() == spdlog::level::debug);

    {
        BINDERY_LOG_SCOPE("scoped work", "bindery_core");
        BINDERY_LOG_DEBUG("inside scope");
    }

    flush_all_loggers();
    set_global_log_level(spdlog::level::info);
}
