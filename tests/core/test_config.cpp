// hark_core ManagerConfig tests

#include <catch2/catch_test_macros.hpp>
#include <hark/core/config.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace hark_core;
using namespace std::chrono_literals;

namespace {

/// Sets an environment variable for the lifetime of the object
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : m_name(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(m_name); }

private:
    const char* m_name;
};

} // namespace

TEST_CASE("ManagerConfig: defaults", "[core][config]") {
    auto config = ManagerConfig::defaults();
    REQUIRE_FALSE(config.default_wait_timeout.has_value());
    REQUIRE_FALSE(config.default_iteration_timeout.has_value());
    REQUIRE_FALSE(config.default_loop_timeout.has_value());
    REQUIRE_FALSE(config.log_level.has_value());
}

TEST_CASE("ManagerConfig: parse JSON", "[core][config]") {
    SECTION("all keys") {
        auto config = parse_config_json(R"({
            "wait_timeout_ms": 250,
            "iteration_timeout_ms": 0,
            "loop_timeout_ms": null,
            "log_level": "debug"
        })");
        REQUIRE(config.is_ok());
        REQUIRE(config->default_wait_timeout == Duration(250ms));
        REQUIRE(config->default_iteration_timeout == Duration(0ms));
        REQUIRE_FALSE(config->default_loop_timeout.has_value());
        REQUIRE(config->log_level == "debug");
    }

    SECTION("missing keys keep defaults") {
        auto config = parse_config_json("{}");
        REQUIRE(config.is_ok());
        REQUIRE_FALSE(config->default_wait_timeout.has_value());
        REQUIRE_FALSE(config->log_level.has_value());
    }

    SECTION("malformed text") {
        auto config = parse_config_json("{ not json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ParseError);
    }

    SECTION("non-object top level") {
        auto config = parse_config_json("[1, 2]");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ParseError);
    }

    SECTION("negative timeout") {
        auto config = parse_config_json(R"({"wait_timeout_ms": -5})");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(config.error().as<ConfigError>()->key == "wait_timeout_ms");
    }

    SECTION("timeout beyond the clock range") {
        auto config = parse_config_json(R"({"wait_timeout_ms": 10000000000000})");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(config.error().as<ConfigError>()->key == "wait_timeout_ms");
    }

    SECTION("largest representable timeout") {
        auto text = R"({"loop_timeout_ms": )" + std::to_string(k_max_timeout_ms) + "}";
        auto config = parse_config_json(text);
        REQUIRE(config.is_ok());
        REQUIRE(config->default_loop_timeout.has_value());
        REQUIRE(*config->default_loop_timeout > Duration::zero());
    }

    SECTION("wrong type") {
        auto config = parse_config_json(R"({"loop_timeout_ms": "soon"})");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("unknown log level") {
        auto config = parse_config_json(R"({"log_level": "chatty"})");
        REQUIRE(config.is_err());
        REQUIRE(config.error().as<ConfigError>()->key == "log_level");
    }
}

TEST_CASE("ManagerConfig: load JSON file", "[core][config]") {
    SECTION("missing file") {
        auto config = load_config_json("/nonexistent/hark_config.json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::NotFound);
    }

    SECTION("file on disk") {
        auto path = std::filesystem::temp_directory_path() / "hark_test_config.json";
        {
            std::ofstream out(path);
            out << R"({"iteration_timeout_ms": 1500})";
        }

        auto config = load_config_json(path);
        REQUIRE(config.is_ok());
        REQUIRE(config->default_iteration_timeout == Duration(1500ms));

        std::filesystem::remove(path);
    }
}

TEST_CASE("ManagerConfig: environment overrides", "[core][config]") {
    SECTION("timeouts and level") {
        ScopedEnv wait("HARKTEST_WAIT_TIMEOUT_MS", "100");
        ScopedEnv loop("HARKTEST_LOOP_TIMEOUT_MS", "none");
        ScopedEnv level("HARKTEST_LOG_LEVEL", "warn");

        ManagerConfig config;
        config.default_loop_timeout = Duration(5s);

        auto r = apply_environment(config, "HARKTEST_");
        REQUIRE(r.is_ok());
        REQUIRE(config.default_wait_timeout == Duration(100ms));
        REQUIRE_FALSE(config.default_loop_timeout.has_value());
        REQUIRE(config.log_level == "warn");
    }

    SECTION("invalid value leaves config untouched") {
        ScopedEnv wait("HARKTEST_WAIT_TIMEOUT_MS", "100");
        ScopedEnv iteration("HARKTEST_ITERATION_TIMEOUT_MS", "12abc");

        ManagerConfig config;
        auto r = apply_environment(config, "HARKTEST_");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
        REQUIRE_FALSE(config.default_wait_timeout.has_value());
    }

    SECTION("timeout beyond the clock range") {
        ScopedEnv wait("HARKTEST_WAIT_TIMEOUT_MS", "10000000000000");

        ManagerConfig config;
        auto r = apply_environment(config, "HARKTEST_");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
        REQUIRE_FALSE(config.default_wait_timeout.has_value());
    }

    SECTION("nothing set") {
        ManagerConfig config;
        auto r = apply_environment(config, "HARKTEST_UNSET_");
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(config.log_level.has_value());
    }
}

TEST_CASE("deadline_after: saturates instead of overflowing", "[core][config]") {
    auto now = Clock::now();

    SECTION("ordinary bound") {
        REQUIRE(deadline_after(now, 10ms) == now + Duration(10ms));
    }

    SECTION("zero and negative bounds expire now") {
        REQUIRE(deadline_after(now, Duration::zero()) == now);
        REQUIRE(deadline_after(now, Duration(-5ms)) == now);
    }

    SECTION("bound past the clock range means no deadline") {
        REQUIRE_FALSE(deadline_after(now, Duration::max()).has_value());
    }
}
