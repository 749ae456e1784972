#pragma once

/// @file config.hpp
/// @brief Configuration for hark event managers
///
/// Values are layered in this order, later layers winning:
/// - Built-in defaults (no timeouts, logging untouched)
/// - JSON file (wait_timeout_ms, iteration_timeout_ms, loop_timeout_ms, log_level)
/// - Environment variables (HARK_WAIT_TIMEOUT_MS, ...)

#include "fwd.hpp"
#include "error.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace hark_core {

/// Clock used for every timeout in hark
using Clock = std::chrono::steady_clock;

/// Timeout length; std::nullopt in an optional means "no bound"
using Duration = Clock::duration;

/// Largest millisecond count a Duration can hold
inline constexpr std::int64_t k_max_timeout_ms =
    std::chrono::duration_cast<std::chrono::milliseconds>(Duration::max()).count();

/// Deadline `bound` after `now`, saturating
/// @return std::nullopt when the deadline is past the clock's range (waits without limit)
[[nodiscard]] inline std::optional<Clock::time_point> deadline_after(Clock::time_point now, Duration bound) {
    if (bound <= Duration::zero()) {
        return now;
    }
    if (bound >= Clock::time_point::max() - now) {
        return std::nullopt;
    }
    return now + bound;
}

/// Defaults applied by EventManager overloads that take no explicit timeouts
struct ManagerConfig {
    std::optional<Duration> default_wait_timeout;
    std::optional<Duration> default_iteration_timeout;
    std::optional<Duration> default_loop_timeout;
    /// Level for the "hark_event" logger; unset leaves the logger alone
    std::optional<std::string> log_level;

    [[nodiscard]] static ManagerConfig defaults() { return ManagerConfig{}; }
};

/// Load configuration from a JSON file on top of the defaults
[[nodiscard]] Result<ManagerConfig> load_config_json(const std::filesystem::path& path);

/// Parse configuration from JSON text on top of the defaults
[[nodiscard]] Result<ManagerConfig> parse_config_json(const std::string& text);

/// Override values from environment variables named <prefix>WAIT_TIMEOUT_MS,
/// <prefix>ITERATION_TIMEOUT_MS, <prefix>LOOP_TIMEOUT_MS and <prefix>LOG_LEVEL.
/// A timeout value of "none" clears the bound. On error the config is untouched.
[[nodiscard]] Result<void> apply_environment(ManagerConfig& config, const std::string& prefix = "HARK_");

} // namespace hark_core
