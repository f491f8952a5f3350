/// @file skill.cpp
/// @brief SkillRecord JSON conversion

#include <fixiplug/skills/skill.hpp>

namespace fixi_skills {

fixi_core::Result<SkillRecord> SkillRecord::from_json(const nlohmann::json& j) {
    using fixi_core::Err;
    using fixi_core::SkillError;

    if (!j.is_object()) {
        return Err<SkillRecord>(SkillError::invalid("metadata must be an object"));
    }

    SkillRecord skill;

    if (!j.contains("name") || !j["name"].is_string() || j["name"].get<std::string>().empty()) {
        return Err<SkillRecord>(SkillError::invalid("missing or invalid 'name' field"));
    }
    skill.name = j["name"].get<std::string>();

    auto read_string = [&j](const char* key, std::string& out) {
        if (j.contains(key) && j[key].is_string()) {
            out = j[key].get<std::string>();
        }
    };

    read_string("pluginName", skill.plugin_id);
    read_string("description", skill.description);
    read_string("instructions", skill.instructions);
    read_string("version", skill.version);
    read_string("level", skill.level);
    read_string("author", skill.author);

    if (j.contains("tags")) {
        if (!j["tags"].is_array()) {
            return Err<SkillRecord>(SkillError::invalid("'tags' must be an array"));
        }
        for (const auto& tag : j["tags"]) {
            if (tag.is_string()) {
                skill.tags.insert(tag.get<std::string>());
            }
        }
    }

    if (j.contains("references") && j["references"].is_array()) {
        for (const auto& ref : j["references"]) {
            if (ref.is_string()) {
                skill.references.push_back(ref.get<std::string>());
            }
        }
    }

    return fixi_core::Ok(std::move(skill));
}

nlohmann::json SkillRecord::to_json() const {
    return to_manifest_entry(true);
}

nlohmann::json SkillRecord::to_manifest_entry(bool include_instructions) const {
    nlohmann::json j;
    j["name"] = name;
    j["pluginName"] = plugin_id;
    j["description"] = description;
    j["tags"] = tags;
    j["level"] = level;
    j["version"] = version;
    j["author"] = author;
    j["references"] = references;
    if (include_instructions) {
        j["instructions"] = instructions;
    }
    return j;
}

} // namespace fixi_skills
