/// @file skill_registry.cpp
/// @brief SkillRegistry implementation

#include <fixiplug/skills/skill_registry.hpp>
#include <fixiplug/core/log.hpp>
#include <algorithm>

namespace fixi_skills {

namespace {

bool contains_name(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // anonymous namespace

fixi_core::Result<void> SkillRegistry::register_skill(const std::string& plugin_id, SkillRecord skill) {
    if (plugin_id.empty()) {
        return fixi_core::Err(fixi_core::SkillError::invalid("plugin id is empty"));
    }
    if (skill.name.empty()) {
        return fixi_core::Err(fixi_core::SkillError::invalid("skill of '" + plugin_id + "' has no name"));
    }

    skill.plugin_id = plugin_id;

    auto it = m_skills.find(plugin_id);
    if (it != m_skills.end()) {
        fixi_core::skills_logger()->debug("Replacing skill '{}' of plugin '{}' with '{}'",
            it->second.name, plugin_id, skill.name);
        it->second = std::move(skill);
    } else {
        fixi_core::skills_logger()->debug("Registering skill '{}' for plugin '{}'", skill.name, plugin_id);
        m_skills.emplace(plugin_id, std::move(skill));
        m_order.push_back(plugin_id);
    }
    return fixi_core::Ok();
}

bool SkillRegistry::unregister_skill(const std::string& plugin_id) {
    if (m_skills.erase(plugin_id) == 0) {
        return false;
    }
    m_order.erase(std::remove(m_order.begin(), m_order.end(), plugin_id), m_order.end());
    return true;
}

const SkillRecord* SkillRegistry::skill(const std::string& name) const {
    for (const auto& plugin_id : m_order) {
        const auto& record = m_skills.at(plugin_id);
        if (record.name == name) {
            return &record;
        }
    }
    return nullptr;
}

const SkillRecord* SkillRegistry::skill_for_plugin(const std::string& plugin_id) const {
    auto it = m_skills.find(plugin_id);
    return it != m_skills.end() ? &it->second : nullptr;
}

std::vector<SkillRecord> SkillRegistry::all_skills() const {
    std::vector<SkillRecord> out;
    out.reserve(m_order.size());
    for (const auto& plugin_id : m_order) {
        out.push_back(m_skills.at(plugin_id));
    }
    return out;
}

std::vector<SkillRecord> SkillRegistry::skills_by_tag(const std::string& tag) const {
    std::vector<SkillRecord> out;
    for (const auto& plugin_id : m_order) {
        const auto& record = m_skills.at(plugin_id);
        if (record.has_tag(tag)) {
            out.push_back(record);
        }
    }
    return out;
}

std::vector<SkillRecord> SkillRegistry::skills_by_level(const std::string& level) const {
    std::vector<SkillRecord> out;
    for (const auto& plugin_id : m_order) {
        const auto& record = m_skills.at(plugin_id);
        if (record.level == level) {
            out.push_back(record);
        }
    }
    return out;
}

std::optional<std::string> SkillRegistry::skill_instructions(const std::string& name) const {
    const auto* record = skill(name);
    if (!record) {
        return std::nullopt;
    }
    return record->instructions;
}

nlohmann::json SkillRegistry::manifest(const ManifestOptions& options) const {
    nlohmann::json entries = nlohmann::json::array();

    for (const auto& plugin_id : m_order) {
        const auto& record = m_skills.at(plugin_id);

        if (!options.include_only.empty() && !contains_name(options.include_only, record.name)) {
            continue;
        }
        if (contains_name(options.exclude, record.name)) {
            continue;
        }
        if (!options.tags.empty() &&
            std::none_of(options.tags.begin(), options.tags.end(),
                [&record](const std::string& tag) { return record.has_tag(tag); })) {
            continue;
        }
        if (options.level && record.level != *options.level) {
            continue;
        }

        entries.push_back(record.to_manifest_entry(options.include_instructions));
    }

    nlohmann::json out;
    out["count"] = entries.size();
    out["skills"] = std::move(entries);
    return out;
}

void SkillRegistry::clear() {
    m_skills.clear();
    m_order.clear();
}

} // namespace fixi_skills
