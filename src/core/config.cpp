/// @file config.cpp
/// @brief Configuration loading for hark_core

#include <hark/core/config.hpp>
#include <hark/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hark_core {

namespace {

using json = nlohmann::json;

/// Read an optional millisecond bound; null clears it, absent leaves it alone
Result<void> read_timeout(const json& j, const char* key, std::optional<Duration>& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return Ok();
    }
    if (it->is_null()) {
        out = std::nullopt;
        return Ok();
    }
    if (!it->is_number_integer()) {
        return Err(ConfigError::invalid_value(key, "expected integer milliseconds or null"));
    }
    if (it->is_number_unsigned() && it->get<std::uint64_t>() > static_cast<std::uint64_t>(k_max_timeout_ms)) {
        return Err(ConfigError::invalid_value(key, "timeout too large"));
    }
    auto ms = it->get<std::int64_t>();
    if (ms < 0) {
        return Err(ConfigError::invalid_value(key, "timeout must not be negative"));
    }
    out = std::chrono::milliseconds(ms);
    return Ok();
}

/// Parse an environment timeout value ("none" or non-negative integer)
Result<std::optional<Duration>> parse_env_timeout(const std::string& key, const std::string& text) {
    if (text == "none") {
        return Result<std::optional<Duration>>(std::optional<Duration>{});
    }
    std::int64_t ms = 0;
    std::size_t consumed = 0;
    try {
        ms = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        return Err<std::optional<Duration>>(ConfigError::invalid_value(key, "not an integer: " + text));
    }
    if (consumed != text.size() || ms < 0) {
        return Err<std::optional<Duration>>(ConfigError::invalid_value(key, "expected non-negative milliseconds: " + text));
    }
    if (ms > k_max_timeout_ms) {
        return Err<std::optional<Duration>>(ConfigError::invalid_value(key, "timeout too large: " + text));
    }
    return Result<std::optional<Duration>>(std::optional<Duration>(std::chrono::milliseconds(ms)));
}

} // anonymous namespace

Result<ManagerConfig> parse_config_json(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return Err<ManagerConfig>(ConfigError::parse_failed(e.what()));
    }

    if (!j.is_object()) {
        return Err<ManagerConfig>(ConfigError::parse_failed("top-level value must be an object"));
    }

    ManagerConfig config = ManagerConfig::defaults();

    if (auto r = read_timeout(j, "wait_timeout_ms", config.default_wait_timeout); !r) {
        return Err<ManagerConfig>(r.error());
    }
    if (auto r = read_timeout(j, "iteration_timeout_ms", config.default_iteration_timeout); !r) {
        return Err<ManagerConfig>(r.error());
    }
    if (auto r = read_timeout(j, "loop_timeout_ms", config.default_loop_timeout); !r) {
        return Err<ManagerConfig>(r.error());
    }

    if (auto it = j.find("log_level"); it != j.end()) {
        if (!it->is_string()) {
            return Err<ManagerConfig>(ConfigError::invalid_value("log_level", "expected string"));
        }
        auto level = it->get<std::string>();
        if (!parse_log_level(level)) {
            return Err<ManagerConfig>(ConfigError::invalid_value("log_level", "unknown level: " + level));
        }
        config.log_level = level;
    }

    return config;
}

Result<ManagerConfig> load_config_json(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<ManagerConfig>(ConfigError::file_not_found(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_config_json(buffer.str());
    if (result) {
        core_logger()->debug("Loaded manager config from {}", path.string());
    } else {
        result.error().with_context("path", path.string());
    }
    return result;
}

Result<void> apply_environment(ManagerConfig& config, const std::string& prefix) {
    ManagerConfig updated = config;

    struct TimeoutVar {
        const char* suffix;
        std::optional<Duration> ManagerConfig::*field;
    };

    const TimeoutVar timeout_vars[] = {
        {"WAIT_TIMEOUT_MS", &ManagerConfig::default_wait_timeout},
        {"ITERATION_TIMEOUT_MS", &ManagerConfig::default_iteration_timeout},
        {"LOOP_TIMEOUT_MS", &ManagerConfig::default_loop_timeout},
    };

    for (const auto& var : timeout_vars) {
        std::string name = prefix + var.suffix;
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            continue;
        }
        auto parsed = parse_env_timeout(name, value);
        if (!parsed) {
            return Err(parsed.error());
        }
        updated.*(var.field) = *parsed;
    }

    std::string level_name = prefix + "LOG_LEVEL";
    if (const char* value = std::getenv(level_name.c_str())) {
        if (!parse_log_level(value)) {
            return Err(ConfigError::invalid_value(level_name, std::string("unknown level: ") + value));
        }
        updated.log_level = value;
    }

    config = std::move(updated);
    return Ok();
}

} // namespace hark_core
