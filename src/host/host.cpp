/// @file host.cpp
/// @brief PluginHost implementation

#include <fixiplug/host/host.hpp>
#include <fixiplug/core/log.hpp>
#include <algorithm>

namespace fixi_host {

using fixi_core::Err;
using fixi_core::Ok;
using fixi_core::PluginError;

PluginHost::PluginHost()
    : PluginHost(HostConfig{}) {}

PluginHost::PluginHost(HostConfig config)
    : m_config(std::move(config))
    , m_dispatcher(m_config.dispatcher)
    , m_log(fixi_core::plugin_logger()) {}

PluginHost::~PluginHost() {
    while (!m_order.empty()) {
        unuse(m_order.back());
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

fixi_core::Result<void> PluginHost::use(std::unique_ptr<Plugin> plugin) {
    if (!plugin) {
        m_log->error("Cannot install a null plugin");
        return Err(PluginError::invalid("null plugin"));
    }

    std::string name = plugin->name();
    if (name.empty()) {
        m_log->error("Cannot install a plugin without a name");
        return Err(PluginError::invalid("empty plugin name"));
    }
    if (m_entries.count(name) > 0) {
        m_log->error("Plugin '{}' is already installed", name);
        return Err(PluginError::already_registered(name));
    }

    lifecycle("Installing plugin '{}'", name);

    Entry& entry = m_entries[name];
    entry.plugin = std::move(plugin);
    entry.context = std::make_unique<PluginContext>(name, m_dispatcher, has_feature(Feature::Testing));
    m_order.push_back(name);
    m_dispatcher.register_plugin(name);

    std::string failure;
    try {
        auto skill = entry.plugin->setup(*entry.context);
        if (skill) {
            auto registered = m_dispatcher.register_skill(name, *skill);
            if (!registered) {
                failure = registered.error().message();
            } else {
                lifecycle("Registered skill '{}' for plugin '{}'", skill->name, name);
                entry.skill = *m_dispatcher.skills().skill_for_plugin(name);
            }
        }
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "unknown exception";
    }

    if (!failure.empty()) {
        m_log->error("Error initializing plugin '{}': {}", name, failure);
        unuse(name);
        return Err(PluginError::setup_failed(name, failure));
    }
    return Ok();
}

bool PluginHost::unuse(const std::string& name) {
    lifecycle("Removing plugin '{}'", name);

    bool installed = false;
    auto it = m_entries.find(name);
    if (it != m_entries.end()) {
        installed = true;
        for (auto& cleanup : it->second.context->take_cleanups()) {
            try {
                cleanup();
            } catch (const std::exception& e) {
                m_log->error("Error during cleanup of plugin '{}': {}", name, e.what());
            } catch (...) {
                m_log->error("Error during cleanup of plugin '{}': unknown exception", name);
            }
        }
        m_entries.erase(it);
        m_order.erase(std::remove(m_order.begin(), m_order.end(), name), m_order.end());
    }

    bool unregistered = m_dispatcher.unregister_plugin(name);
    return installed || unregistered;
}

fixi_core::Result<void> PluginHost::swap(const std::string& old_name, std::unique_ptr<Plugin> replacement) {
    lifecycle("Swapping plugin '{}' with '{}'", old_name, replacement ? replacement->name() : "<null>");
    unuse(old_name);
    return use(std::move(replacement));
}

fixi_core::Result<void> PluginHost::enable(const std::string& name) {
    if (m_entries.count(name) == 0) {
        m_log->error("Cannot enable plugin '{}': plugin not found", name);
        return Err(PluginError::not_found(name));
    }
    return m_dispatcher.enable_plugin(name);
}

fixi_core::Result<void> PluginHost::disable(const std::string& name) {
    if (m_entries.count(name) == 0) {
        m_log->error("Cannot disable plugin '{}': plugin not found", name);
        return Err(PluginError::not_found(name));
    }
    return m_dispatcher.disable_plugin(name);
}

// =============================================================================
// Dispatch
// =============================================================================

fixi_hooks::Event PluginHost::dispatch(const fixi_hooks::HookName& hook, fixi_hooks::Event event) {
    m_log->trace("Dispatching hook '{}'", hook);
    return m_dispatcher.dispatch(hook, std::move(event));
}

bool PluginHost::off(const fixi_hooks::HookName& hook, fixi_hooks::HandlerId id) {
    return m_dispatcher.off(hook, id);
}

std::size_t PluginHost::tick() {
    return m_dispatcher.tick();
}

std::size_t PluginHost::run_until_idle(std::size_t max_ticks) {
    return m_dispatcher.run_until_idle(max_ticks);
}

// =============================================================================
// Introspection
// =============================================================================

std::vector<std::string> PluginHost::plugins() const {
    return m_order;
}

nlohmann::json PluginHost::describe(const std::string& name, const Entry& entry) const {
    return {
        {"name", name},
        {"disabled", m_dispatcher.is_disabled(name)},
        {"hasSkill", entry.skill.has_value()},
        {"skill", entry.skill ? entry.skill->to_json() : nlohmann::json(nullptr)}};
}

nlohmann::json PluginHost::plugins_info() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& name : m_order) {
        out.push_back(describe(name, m_entries.at(name)));
    }
    return out;
}

std::optional<nlohmann::json> PluginHost::plugin_info(const std::string& name) const {
    auto it = m_entries.find(name);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return describe(name, it->second);
}

bool PluginHost::has_plugin(const std::string& name) const {
    return m_entries.count(name) > 0;
}

nlohmann::json PluginHost::skills_manifest(const fixi_skills::ManifestOptions& options) const {
    return m_dispatcher.skills().manifest(options);
}

std::optional<std::string> PluginHost::skill_instructions(const std::string& skill_name) const {
    return m_dispatcher.skills().skill_instructions(skill_name);
}

} // namespace fixi_host
