#pragma once

/// @file core.hpp
/// @brief Main include file for hark_core module
///
/// This header includes all hark_core components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Error handling
#include "error.hpp"

// Logging
#include "log.hpp"

// Configuration
#include "config.hpp"

/// @namespace hark_core
/// @brief Infrastructure shared by the hark modules
///
/// - **Error Handling**: Result<T> with WaitError / ConfigError kinds
/// - **Logging**: spdlog-backed named loggers
/// - **Configuration**: ManagerConfig from JSON and environment
///
/// Example usage:
/// @code
/// #include <hark/core/core.hpp>
///
/// auto config = hark_core::load_config_json("hark.json");
/// if (!config) {
///     HARK_LOG_ERROR("{}", hark_core::build_error_chain(config.error()));
/// }
/// @endcode
