#pragma once

/// @file config.hpp
/// @brief Dispatcher and logging configuration
///
/// Configuration can come from:
/// - Defaults (the values below)
/// - A JSON object embedded in a host config
/// - A JSON file on disk

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <filesystem>
#include <string>

namespace fixi_core {

// =============================================================================
// DispatcherConfig
// =============================================================================

/// Limits and names used by the hook dispatcher
struct DispatcherConfig {
    /// Maximum pending deferred events; further emits are dropped
    std::size_t max_queue{1000};

    /// Deferred events dispatched per drain tick
    std::size_t batch_size{50};

    /// Emissions of one hook name (per drain cycle) above which a warning is logged
    std::size_t loop_warn_threshold{100};

    /// Emissions of one hook name (per drain cycle) above which events are dropped
    std::size_t loop_drop_threshold{500};

    /// Hook that receives captured handler failures
    std::string error_hook{"pluginError"};

    /// Parse from JSON. Missing fields keep their defaults.
    [[nodiscard]] static Result<DispatcherConfig> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;

    /// Check ranges (non-zero sizes, warn <= drop, non-empty error hook)
    [[nodiscard]] Result<void> validate() const;
};

/// Read a DispatcherConfig from a JSON file
[[nodiscard]] Result<DispatcherConfig> load_dispatcher_config(const std::filesystem::path& path);

/// Parse a LogConfig from JSON ("level", "console", "file", "directory", "max_file_size", "max_files")
[[nodiscard]] Result<LogConfig> log_config_from_json(const nlohmann::json& j);

} // namespace fixi_core
