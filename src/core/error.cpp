/// @file error.cpp
/// @brief Error formatting for fixi_core
///
/// The error system is primarily template-based and header-only.
/// This file provides the out-of-line formatting used when errors are logged.

#include <fixiplug/core/error.hpp>
#include <sstream>

namespace fixi_core {

namespace detail {

std::string format_plugin_error(const PluginError& err) {
    std::ostringstream oss;
    oss << "[PluginError] " << err.message;

    if (!err.plugin_id.empty()) {
        oss << " (plugin: " << err.plugin_id << ")";
    }
    return oss.str();
}

std::string format_skill_error(const SkillError& err) {
    std::ostringstream oss;
    oss << "[SkillError] " << err.message;

    if (!err.skill_name.empty()) {
        oss << " (skill: " << err.skill_name << ")";
    }
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.field.empty()) {
        oss << " (field: " << err.field << ")";
    }
    return oss.str();
}

} // namespace detail

/// Build a full error message with kind details and context
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, PluginError>) {
            oss << detail::format_plugin_error(err);
        } else if constexpr (std::is_same_v<T, SkillError>) {
            oss << detail::format_skill_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=\"" << value << "\"}";
    }

    return oss.str();
}

// Common Result types used throughout the library
template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;

} // namespace fixi_core
