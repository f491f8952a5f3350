#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for fixi_host

#include <cstdint>

namespace fixi_host {

enum class Feature : std::uint8_t;
struct HostConfig;

class PluginStorage;
class PluginContext;
class Plugin;
class PluginHost;

} // namespace fixi_host
