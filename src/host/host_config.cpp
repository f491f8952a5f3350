/// @file host_config.cpp
/// @brief HostConfig JSON conversion

#include <fixiplug/host/host_config.hpp>

namespace fixi_host {

std::optional<Feature> parse_feature(const std::string& name) {
    for (auto feature : {Feature::Dom, Feature::Logging, Feature::Testing, Feature::Server}) {
        if (name == feature_name(feature)) {
            return feature;
        }
    }
    return std::nullopt;
}

fixi_core::Result<HostConfig> HostConfig::from_json(const nlohmann::json& j) {
    using fixi_core::ConfigError;
    using fixi_core::Err;

    if (!j.is_object()) {
        return Err<HostConfig>(ConfigError::parse("host config must be an object"));
    }

    HostConfig config;

    if (j.contains("features")) {
        const auto& features = j["features"];
        if (!features.is_array()) {
            return Err<HostConfig>(ConfigError::invalid_value("features", "expected an array of names"));
        }
        for (const auto& entry : features) {
            if (!entry.is_string()) {
                return Err<HostConfig>(ConfigError::invalid_value("features", "feature names must be strings"));
            }
            auto feature = parse_feature(entry.get<std::string>());
            if (!feature) {
                return Err<HostConfig>(ConfigError::invalid_value(
                    "features", "unknown feature '" + entry.get<std::string>() + "'"));
            }
            config.features.insert(*feature);
        }
    }

    if (j.contains("advanced")) {
        if (!j["advanced"].is_object()) {
            return Err<HostConfig>(ConfigError::invalid_value("advanced", "expected an object"));
        }
        config.advanced = j["advanced"];
    }

    if (j.contains("dispatcher")) {
        auto dispatcher = fixi_core::DispatcherConfig::from_json(j["dispatcher"]);
        if (!dispatcher) {
            return Err<HostConfig>(dispatcher.error());
        }
        config.dispatcher = std::move(dispatcher).value();
    }

    return fixi_core::Ok(std::move(config));
}

nlohmann::json HostConfig::to_json() const {
    nlohmann::json names = nlohmann::json::array();
    for (auto feature : features) {
        names.push_back(feature_name(feature));
    }
    return {
        {"features", names},
        {"advanced", advanced},
        {"dispatcher", dispatcher.to_json()}};
}

} // namespace fixi_host
