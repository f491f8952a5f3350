/// @file config.cpp
/// @brief JSON loading for fixi_core configuration

#include <fixiplug/core/config.hpp>
#include <fstream>

namespace fixi_core {

namespace {

/// Read an optional unsigned field; absent fields leave `out` untouched
Result<void> read_size(const nlohmann::json& j, const char* key, std::size_t& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j[key];
    if (!value.is_number_integer() || value.get<std::int64_t>() < 0) {
        return Err(ConfigError::invalid_value(key, "expected a non-negative integer"));
    }
    out = value.get<std::size_t>();
    return Ok();
}

} // anonymous namespace

// =============================================================================
// DispatcherConfig
// =============================================================================

Result<DispatcherConfig> DispatcherConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<DispatcherConfig>(ConfigError::parse("dispatcher config must be an object"));
    }

    DispatcherConfig config;

    for (auto [key, field] : {
             std::pair{"max_queue", &config.max_queue},
             std::pair{"batch_size", &config.batch_size},
             std::pair{"loop_warn_threshold", &config.loop_warn_threshold},
             std::pair{"loop_drop_threshold", &config.loop_drop_threshold}}) {
        auto result = read_size(j, key, *field);
        if (!result) {
            return Err<DispatcherConfig>(result.error());
        }
    }

    if (j.contains("error_hook")) {
        if (!j["error_hook"].is_string()) {
            return Err<DispatcherConfig>(ConfigError::invalid_value("error_hook", "expected a string"));
        }
        config.error_hook = j["error_hook"].get<std::string>();
    }

    auto valid = config.validate();
    if (!valid) {
        return Err<DispatcherConfig>(valid.error());
    }
    return Ok(std::move(config));
}

nlohmann::json DispatcherConfig::to_json() const {
    nlohmann::json j;
    j["max_queue"] = max_queue;
    j["batch_size"] = batch_size;
    j["loop_warn_threshold"] = loop_warn_threshold;
    j["loop_drop_threshold"] = loop_drop_threshold;
    j["error_hook"] = error_hook;
    return j;
}

Result<void> DispatcherConfig::validate() const {
    if (max_queue == 0) {
        return Err(ConfigError::invalid_value("max_queue", "must be greater than zero"));
    }
    if (batch_size == 0) {
        return Err(ConfigError::invalid_value("batch_size", "must be greater than zero"));
    }
    if (loop_warn_threshold > loop_drop_threshold) {
        return Err(ConfigError::invalid_value("loop_warn_threshold", "must not exceed loop_drop_threshold"));
    }
    if (error_hook.empty() || error_hook == "*") {
        return Err(ConfigError::invalid_value("error_hook", "must name a concrete hook"));
    }
    return Ok();
}

Result<DispatcherConfig> load_dispatcher_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<DispatcherConfig>(ConfigError::io(path.string()));
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        return Err<DispatcherConfig>(ConfigError::parse(path.string()));
    }

    // Accept either a bare object or one nested under "dispatcher"
    if (j.contains("dispatcher")) {
        return DispatcherConfig::from_json(j["dispatcher"]);
    }
    return DispatcherConfig::from_json(j);
}

// =============================================================================
// LogConfig
// =============================================================================

Result<LogConfig> log_config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<LogConfig>(ConfigError::parse("log config must be an object"));
    }

    LogConfig config;

    if (j.contains("level")) {
        if (!j["level"].is_string()) {
            return Err<LogConfig>(ConfigError::invalid_value("level", "expected a string"));
        }
        auto level = parse_log_level(j["level"].get<std::string>());
        if (!level) {
            return Err<LogConfig>(ConfigError::invalid_value("level", "unknown level " + j["level"].get<std::string>()));
        }
        config.level = *level;
    }

    if (j.contains("console") && j["console"].is_boolean()) {
        config.console_enabled = j["console"].get<bool>();
    }
    if (j.contains("file") && j["file"].is_boolean()) {
        config.file_enabled = j["file"].get<bool>();
    }
    if (j.contains("directory") && j["directory"].is_string()) {
        config.log_directory = j["directory"].get<std::string>();
    }

    auto size_ok = read_size(j, "max_file_size", config.max_file_size);
    if (!size_ok) {
        return Err<LogConfig>(size_ok.error());
    }
    auto files_ok = read_size(j, "max_files", config.max_files);
    if (!files_ok) {
        return Err<LogConfig>(files_ok.error());
    }

    if (config.file_enabled && config.log_directory.empty()) {
        return Err<LogConfig>(ConfigError::invalid_value("directory", "required when file logging is enabled"));
    }

    return Ok(std::move(config));
}

} // namespace fixi_core
