// hark_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <hark/core/log.hpp>

#include <string>

using namespace hark_core;

TEST_CASE("Log level parsing", "[core][log]") {
    SECTION("known names and aliases") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("unknown name") {
        REQUIRE_FALSE(parse_log_level("chatty").has_value());
        REQUIRE_FALSE(parse_log_level("").has_value());
    }

    SECTION("names round-trip through parse") {
        REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
        REQUIRE(parse_log_level(log_level_name(spdlog::level::debug)) == spdlog::level::debug);
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    auto event = event_logger();
    REQUIRE(event->name() == "hark_event");
    REQUIRE(get_logger("hark_event") == event);
    REQUIRE(core_logger()->name() == "hark_core");
}

TEST_CASE("Log level management", "[core][log]") {
    auto previous = get_global_log_level();

    SECTION("global level reaches every named logger") {
        set_global_log_level(spdlog::level::warn);
        REQUIRE(get_global_log_level() == spdlog::level::warn);
        REQUIRE(event_logger()->level() == spdlog::level::warn);
        REQUIRE(core_logger()->level() == spdlog::level::warn);
    }

    SECTION("per-logger level leaves the others alone") {
        set_global_log_level(spdlog::level::info);
        set_logger_level("hark_event", spdlog::level::debug);
        REQUIRE(event_logger()->level() == spdlog::level::debug);
        REQUIRE(core_logger()->level() == spdlog::level::info);
        REQUIRE(get_global_log_level() == spdlog::level::info);
    }

    SECTION("unknown logger is ignored") {
        set_logger_level("hark_missing", spdlog::level::trace);
        REQUIRE(spdlog::get("hark_missing") == nullptr);
    }

    set_global_log_level(previous);
}
