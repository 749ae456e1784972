/// @file error.cpp
/// @brief Error handling implementation for hark_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error counters for diagnostics

#include <hark/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace hark_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format wait error with the event it was waiting on
std::string format_wait_error(const WaitError& err) {
    std::ostringstream oss;
    oss << "[" << wait_error_kind_name(err.kind) << "] " << err.message;

    if (!err.event_name.empty()) {
        oss << " (event: " << err.event_name << ")";
    }

    return oss.str();
}

/// Format config error with the offending key
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, WaitError>) {
            oss << detail::format_wait_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> timeout_errors{0};
    std::atomic<std::uint64_t> cancelled_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (const auto* wait = error.as<WaitError>()) {
        if (wait->kind == WaitError::Kind::Cancelled) {
            s_error_stats.cancelled_errors.fetch_add(1, std::memory_order_relaxed);
        } else if (wait->kind != WaitError::Kind::Exhausted) {
            s_error_stats.timeout_errors.fetch_add(1, std::memory_order_relaxed);
        }
    } else if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t timeout_error_count() {
    return s_error_stats.timeout_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.timeout_errors.store(0, std::memory_order_relaxed);
    s_error_stats.cancelled_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Timeout: " << s_error_stats.timeout_errors.load() << "\n"
        << "  Cancelled: " << s_error_stats.cancelled_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace hark_core
