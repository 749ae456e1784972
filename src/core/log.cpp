/// @file log.cpp
/// @brief Logging system implementation for hark_core
///
/// Extends the spdlog-based logging with:
/// - Named loggers per module (hark_core, hark_event)
/// - Console and rotating file sinks
/// - Global and per-logger level control

#include <hark/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace hark_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

/// Registry of named loggers
struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum global_level = spdlog::level::info;
    std::string log_directory;
    bool console_enabled = true;
    bool file_enabled = false;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Create sinks based on current configuration (registry lock held)
std::vector<spdlog::sink_ptr> create_sinks(const LoggerRegistry& reg, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (reg.console_enabled) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console_sink);
    }

    if (reg.file_enabled && !reg.log_directory.empty()) {
        try {
            std::filesystem::path log_path = std::filesystem::path(reg.log_directory) / (name + ".log");
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path.string(),
                reg.max_file_size,
                reg.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Failed to create log file for '{}': {}", name, e.what());
        }
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

/// Configure logging system
void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.console_enabled = config.console_enabled;
    reg.file_enabled = config.file_enabled;
    reg.log_directory = config.log_directory;
    reg.max_file_size = config.max_file_size;
    reg.max_files = config.max_files;
    reg.global_level = config.level;

    // Existing loggers keep their sinks, only the level follows
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(reg.global_level);
    }

    spdlog::set_level(reg.global_level);
}

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    // Someone else may have registered the name directly with spdlog
    if (auto existing = spdlog::get(name)) {
        reg.loggers[name] = existing;
        return existing;
    }

    auto sinks = create_sinks(reg, name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.global_level);

    reg.loggers[name] = logger;
    spdlog::register_logger(logger);

    return logger;
}

/// Get the core module logger
std::shared_ptr<spdlog::logger> core_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("hark_core");
    return logger;
}

/// Get the event module logger
std::shared_ptr<spdlog::logger> event_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("hark_event");
    return logger;
}

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.global_level = level;
    spdlog::set_level(level);

    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        it->second->set_level(level);
    }
}

/// Get current global log level
spdlog::level::level_enum get_global_log_level() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.global_level;
}

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Logging Shutdown
// =============================================================================

/// Flush all loggers
void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

/// Shutdown logging system
void shutdown_logging() {
    flush_all_loggers();

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();

    spdlog::shutdown();
}

} // namespace hark_core
