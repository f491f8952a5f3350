#pragma once

/// @file host.hpp
/// @brief PluginHost: installs plugins on a dispatcher and manages their lifetime

#include "fwd.hpp"
#include "host_config.hpp"
#include "plugin.hpp"
#include <fixiplug/core/error.hpp>
#include <fixiplug/hooks/dispatcher.hpp>
#include <fixiplug/skills/skill_registry.hpp>
#include <spdlog/spdlog.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fixi_host {

/// Owns a Dispatcher and the plugins installed on it.
///
/// @code
/// fixi_host::PluginHost host(fixi_host::HostConfig::with_features(fixi_host::feature_sets::CORE));
/// host.use(fixi_host::make_plugin("greeter", [](fixi_host::PluginContext& ctx) {
///     ctx.on("greet", [](const fixi_hooks::Event& e, const fixi_hooks::HookName&) {
///         auto out = e;
///         out["greeting"] = "hello";
///         return std::optional<fixi_hooks::Event>(out);
///     });
///     return std::optional<fixi_skills::SkillRecord>{};
/// }));
/// auto result = host.dispatch("greet");
/// host.run_until_idle();
/// @endcode
class PluginHost {
public:
    PluginHost();

    /// @throws std::invalid_argument if the dispatcher config is invalid
    explicit PluginHost(HostConfig config);

    /// Removes remaining plugins, newest first
    ~PluginHost();

    PluginHost(const PluginHost&) = delete;
    PluginHost& operator=(const PluginHost&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Install a plugin and run its setup
    fixi_core::Result<void> use(std::unique_ptr<Plugin> plugin);

    /// Run cleanups and remove the plugin with its handlers and skill
    bool unuse(const std::string& name);

    /// Remove `old_name` then install `replacement`
    fixi_core::Result<void> swap(const std::string& old_name, std::unique_ptr<Plugin> replacement);

    fixi_core::Result<void> enable(const std::string& name);
    fixi_core::Result<void> disable(const std::string& name);

    // =========================================================================
    // Dispatch
    // =========================================================================

    fixi_hooks::Event dispatch(const fixi_hooks::HookName& hook,
                               fixi_hooks::Event event = fixi_hooks::Event::object());

    bool off(const fixi_hooks::HookName& hook, fixi_hooks::HandlerId id);

    std::size_t tick();
    std::size_t run_until_idle(std::size_t max_ticks = 100000);

    // =========================================================================
    // Introspection
    // =========================================================================

    /// Installed plugin names in installation order
    [[nodiscard]] std::vector<std::string> plugins() const;

    /// `[{name, disabled, hasSkill, skill}]`
    [[nodiscard]] nlohmann::json plugins_info() const;

    [[nodiscard]] std::optional<nlohmann::json> plugin_info(const std::string& name) const;

    [[nodiscard]] bool has_plugin(const std::string& name) const;

    [[nodiscard]] bool has_feature(Feature feature) const { return m_config.has_feature(feature); }

    [[nodiscard]] nlohmann::json skills_manifest(const fixi_skills::ManifestOptions& options = {}) const;

    [[nodiscard]] std::optional<std::string> skill_instructions(const std::string& skill_name) const;

    [[nodiscard]] fixi_hooks::Dispatcher& dispatcher() noexcept { return m_dispatcher; }
    [[nodiscard]] const fixi_hooks::Dispatcher& dispatcher() const noexcept { return m_dispatcher; }

    [[nodiscard]] const HostConfig& config() const noexcept { return m_config; }

private:
    struct Entry {
        std::unique_ptr<Plugin> plugin;
        std::unique_ptr<PluginContext> context;
        std::optional<fixi_skills::SkillRecord> skill;
    };

    [[nodiscard]] nlohmann::json describe(const std::string& name, const Entry& entry) const;

    /// Lifecycle message, info with the Logging feature and debug otherwise
    template<typename... Args>
    void lifecycle(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        auto level = has_feature(Feature::Logging) ? spdlog::level::info : spdlog::level::debug;
        m_log->log(level, fmt, std::forward<Args>(args)...);
    }

    HostConfig m_config;
    fixi_hooks::Dispatcher m_dispatcher;
    std::map<std::string, Entry> m_entries;
    std::vector<std::string> m_order;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace fixi_host
