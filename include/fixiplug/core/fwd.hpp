#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for fixi_core module

#include <cstdint>

namespace fixi_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct PluginError;
struct SkillError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Configuration
// =============================================================================

struct DispatcherConfig;
struct LogConfig;

} // namespace fixi_core
