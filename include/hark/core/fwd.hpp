#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for hark_core module

#include <cstdint>

namespace hark_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct WaitError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

// =============================================================================
// Configuration
// =============================================================================

struct ManagerConfig;

} // namespace hark_core
