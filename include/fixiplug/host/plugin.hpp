#pragma once

/// @file plugin.hpp
/// @brief Plugin base class and the context handed to setup

#include "fwd.hpp"
#include <fixiplug/hooks/dispatcher.hpp>
#include <fixiplug/skills/skill.hpp>
#include <any>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fixi_host {

// =============================================================================
// PluginStorage
// =============================================================================

/// Per-plugin typed key/value store
class PluginStorage {
public:
    template<typename T>
    void insert(const std::string& key, T value) {
        m_data[key] = std::move(value);
    }

    template<typename T>
    [[nodiscard]] const T* get(const std::string& key) const {
        auto it = m_data.find(key);
        if (it == m_data.end()) {
            return nullptr;
        }
        return std::any_cast<T>(&it->second);
    }

    template<typename T>
    [[nodiscard]] T* get_mut(const std::string& key) {
        auto it = m_data.find(key);
        if (it == m_data.end()) {
            return nullptr;
        }
        return std::any_cast<T>(&it->second);
    }

    bool remove(const std::string& key) {
        return m_data.erase(key) > 0;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return m_data.find(key) != m_data.end();
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_data.size(); }

private:
    std::map<std::string, std::any> m_data;
};

// =============================================================================
// PluginContext
// =============================================================================

/// Handle a plugin uses to talk to the dispatcher during and after setup.
/// Handlers registered here are owned by the plugin.
class PluginContext {
public:
    using Cleanup = std::function<void()>;

    PluginContext(std::string plugin_name, fixi_hooks::Dispatcher& dispatcher, bool debug);

    PluginContext(const PluginContext&) = delete;
    PluginContext& operator=(const PluginContext&) = delete;

    [[nodiscard]] const std::string& plugin_name() const noexcept { return m_plugin_name; }

    fixi_hooks::HandlerId on(const fixi_hooks::HookName& hook, fixi_hooks::Handler handler,
                             int priority = fixi_hooks::priority::NORMAL);

    /// Detach a handler registered through this context
    bool off(const fixi_hooks::HookName& hook, fixi_hooks::HandlerId id);

    void emit(const fixi_hooks::HookName& hook, fixi_hooks::Event event = fixi_hooks::Event::object());

    fixi_hooks::Event dispatch(const fixi_hooks::HookName& hook,
                               fixi_hooks::Event event = fixi_hooks::Event::object());

    /// Run when the plugin is removed from its host
    void register_cleanup(Cleanup fn);

    /// Hand over registered cleanups in registration order
    [[nodiscard]] std::vector<Cleanup> take_cleanups();

    [[nodiscard]] PluginStorage& storage() noexcept { return m_storage; }
    [[nodiscard]] const PluginStorage& storage() const noexcept { return m_storage; }

    /// True when the host runs with the Testing feature
    [[nodiscard]] bool debug() const noexcept { return m_debug; }

private:
    std::string m_plugin_name;
    fixi_hooks::Dispatcher* m_dispatcher;
    bool m_debug;
    std::vector<std::pair<fixi_hooks::HookName, fixi_hooks::HandlerId>> m_bindings;
    std::vector<Cleanup> m_cleanups;
    PluginStorage m_storage;
};

// =============================================================================
// Plugin
// =============================================================================

/// Base class for host plugins
class Plugin {
public:
    virtual ~Plugin() = default;

    /// Unique plugin name
    [[nodiscard]] virtual std::string name() const = 0;

    /// Register handlers. May return skill metadata to publish.
    /// Throwing aborts installation.
    virtual std::optional<fixi_skills::SkillRecord> setup(PluginContext& ctx) = 0;
};

using SetupFn = std::function<std::optional<fixi_skills::SkillRecord>(PluginContext&)>;

/// Wrap a setup callable as a plugin
[[nodiscard]] std::unique_ptr<Plugin> make_plugin(std::string name, SetupFn setup);

} // namespace fixi_host
