#pragma once

/// @file skill.hpp
/// @brief Descriptive capability metadata a plugin publishes about itself

#include "fwd.hpp"
#include <fixiplug/core/error.hpp>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace fixi_skills {

/// Default level for skills that do not declare one
inline constexpr const char* k_default_level = "intermediate";

/// Default version for skills that do not declare one
inline constexpr const char* k_default_version = "1.0.0";

/// Skill metadata. Purely introspective: never consulted by dispatch.
struct SkillRecord {
    std::string plugin_id;
    std::string name;
    std::string description;
    std::string instructions;
    std::set<std::string> tags;
    std::string version{k_default_version};
    std::string level{k_default_level};
    std::string author;
    std::vector<std::string> references;

    [[nodiscard]] bool has_tag(const std::string& tag) const {
        return tags.count(tag) > 0;
    }

    /// Parse skill metadata. `name` is required; everything else is optional.
    /// Accepts "pluginName" as the owner field.
    [[nodiscard]] static fixi_core::Result<SkillRecord> from_json(const nlohmann::json& j);

    /// Full record, including instructions
    [[nodiscard]] nlohmann::json to_json() const;

    /// Discovery entry (no instructions unless asked for)
    [[nodiscard]] nlohmann::json to_manifest_entry(bool include_instructions) const;
};

} // namespace fixi_skills
