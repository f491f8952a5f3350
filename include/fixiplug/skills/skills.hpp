#pragma once

/// @file skills.hpp
/// @brief Main include header for fixi_skills

#include "fwd.hpp"
#include "skill.hpp"
#include "skill_registry.hpp"
