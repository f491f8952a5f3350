#pragma once

/// @file skill_registry.hpp
/// @brief Plugin id -> skill metadata side table used for capability discovery

#include "fwd.hpp"
#include "skill.hpp"
#include <fixiplug/core/error.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fixi_skills {

/// Filters for manifest generation. Empty filters match everything.
struct ManifestOptions {
    /// Include the (potentially long) instructions text
    bool include_instructions = false;
    /// Only these skill names
    std::vector<std::string> include_only;
    /// Never these skill names
    std::vector<std::string> exclude;
    /// Skill must carry at least one of these tags
    std::vector<std::string> tags;
    /// Skill must have exactly this level
    std::optional<std::string> level;
};

/// One skill per plugin, kept in registration order
class SkillRegistry {
public:
    /// Store (or overwrite) the skill of a plugin
    fixi_core::Result<void> register_skill(const std::string& plugin_id, SkillRecord skill);

    /// Remove a plugin's skill; false if it had none
    bool unregister_skill(const std::string& plugin_id);

    /// Look up by skill name
    [[nodiscard]] const SkillRecord* skill(const std::string& name) const;

    /// Look up by owning plugin
    [[nodiscard]] const SkillRecord* skill_for_plugin(const std::string& plugin_id) const;

    [[nodiscard]] bool has_skill(const std::string& name) const { return skill(name) != nullptr; }

    [[nodiscard]] std::vector<SkillRecord> all_skills() const;
    [[nodiscard]] std::vector<SkillRecord> skills_by_tag(const std::string& tag) const;
    [[nodiscard]] std::vector<SkillRecord> skills_by_level(const std::string& level) const;

    /// Full instructions for on-demand consumption
    [[nodiscard]] std::optional<std::string> skill_instructions(const std::string& name) const;

    /// Low-cost discovery document: {"count": n, "skills": [...]}
    [[nodiscard]] nlohmann::json manifest(const ManifestOptions& options = {}) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_skills.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_skills.empty(); }

    void clear();

private:
    std::map<std::string, SkillRecord> m_skills;
    std::vector<std::string> m_order;
};

} // namespace fixi_skills
