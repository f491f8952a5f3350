#pragma once

/// @file log.hpp
/// @brief Logging utilities for fixiplug

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>

// =============================================================================
// Logging Macros
// =============================================================================

#define FIXI_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define FIXI_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define FIXI_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define FIXI_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define FIXI_LOG_ERROR(...) spdlog::error(__VA_ARGS__)

namespace fixi_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Dispatcher, queues and guard
std::shared_ptr<spdlog::logger> hooks_logger();

/// Plugin host lifecycle
std::shared_ptr<spdlog::logger> plugin_logger();

/// Skill registry
std::shared_ptr<spdlog::logger> skills_logger();

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

void set_logger_level(const std::string& name, spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Parse log level from string ("trace", "debug", "info", "warn", ...)
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Drop every named logger and shut spdlog down
void shutdown_logging();

} // namespace fixi_core
