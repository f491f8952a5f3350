#pragma once

/// @file host_config.hpp
/// @brief Feature flags and configuration for a PluginHost

#include "fwd.hpp"
#include <fixiplug/core/config.hpp>
#include <fixiplug/core/error.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace fixi_host {

// =============================================================================
// Feature
// =============================================================================

/// Optional host behaviours
enum class Feature : std::uint8_t {
    Dom,      // Accepted for compatibility, no effect
    Logging,  // Lifecycle messages at info instead of debug
    Testing,  // PluginContext::debug() is true
    Server,
};

[[nodiscard]] inline const char* feature_name(Feature feature) {
    switch (feature) {
        case Feature::Dom: return "dom";
        case Feature::Logging: return "logging";
        case Feature::Testing: return "testing";
        case Feature::Server: return "server";
        default: return "unknown";
    }
}

/// Parse a lowercase feature name
[[nodiscard]] std::optional<Feature> parse_feature(const std::string& name);

using FeatureSet = std::set<Feature>;

/// Predefined feature sets
namespace feature_sets {
    inline const FeatureSet BROWSER{Feature::Dom, Feature::Logging};
    inline const FeatureSet CORE{Feature::Logging};
    inline const FeatureSet TEST{Feature::Testing, Feature::Logging};
    inline const FeatureSet SERVER{Feature::Server};
    inline const FeatureSet MINIMAL{};
} // namespace feature_sets

// =============================================================================
// HostConfig
// =============================================================================

struct HostConfig {
    FeatureSet features;

    /// Free-form settings passed through untouched
    nlohmann::json advanced = nlohmann::json::object();

    fixi_core::DispatcherConfig dispatcher;

    [[nodiscard]] bool has_feature(Feature feature) const {
        return features.count(feature) > 0;
    }

    /// Parse `{"features": [...], "advanced": {...}, "dispatcher": {...}}`.
    /// Every key is optional.
    [[nodiscard]] static fixi_core::Result<HostConfig> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;

    [[nodiscard]] static HostConfig with_features(FeatureSet set) {
        HostConfig config;
        config.features = std::move(set);
        return config;
    }
};

} // namespace fixi_host
