#pragma once

/// @file fixiplug.hpp
/// @brief Umbrella header for every fixiplug module

#include "core/core.hpp"
#include "hooks/hooks.hpp"
#include "skills/skills.hpp"
#include "host/host_config.hpp"
#include "host/plugin.hpp"
#include "host/host.hpp"
