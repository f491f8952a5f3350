#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for fixi_skills

namespace fixi_skills {

struct SkillRecord;
struct ManifestOptions;
class SkillRegistry;

} // namespace fixi_skills
