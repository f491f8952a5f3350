/// @file plugin.cpp
/// @brief PluginContext and callable plugin implementation

#include <fixiplug/host/plugin.hpp>
#include <algorithm>

namespace fixi_host {

// =============================================================================
// PluginContext
// =============================================================================

PluginContext::PluginContext(std::string plugin_name, fixi_hooks::Dispatcher& dispatcher, bool debug)
    : m_plugin_name(std::move(plugin_name))
    , m_dispatcher(&dispatcher)
    , m_debug(debug) {}

fixi_hooks::HandlerId PluginContext::on(const fixi_hooks::HookName& hook, fixi_hooks::Handler handler,
                                        int priority) {
    auto id = m_dispatcher->on(hook, std::move(handler), m_plugin_name, priority);
    m_bindings.emplace_back(hook, id);
    return id;
}

bool PluginContext::off(const fixi_hooks::HookName& hook, fixi_hooks::HandlerId id) {
    auto it = std::find(m_bindings.begin(), m_bindings.end(), std::make_pair(hook, id));
    if (it == m_bindings.end()) {
        return false;
    }
    m_bindings.erase(it);
    return m_dispatcher->off(hook, id);
}

void PluginContext::emit(const fixi_hooks::HookName& hook, fixi_hooks::Event event) {
    m_dispatcher->emit(hook, std::move(event));
}

fixi_hooks::Event PluginContext::dispatch(const fixi_hooks::HookName& hook, fixi_hooks::Event event) {
    return m_dispatcher->dispatch(hook, std::move(event));
}

void PluginContext::register_cleanup(Cleanup fn) {
    if (fn) {
        m_cleanups.push_back(std::move(fn));
    }
}

std::vector<PluginContext::Cleanup> PluginContext::take_cleanups() {
    return std::exchange(m_cleanups, {});
}

// =============================================================================
// Callable plugin
// =============================================================================

namespace {

class FunctionPlugin final : public Plugin {
public:
    FunctionPlugin(std::string name, SetupFn setup)
        : m_name(std::move(name)), m_setup(std::move(setup)) {}

    [[nodiscard]] std::string name() const override { return m_name; }

    std::optional<fixi_skills::SkillRecord> setup(PluginContext& ctx) override {
        if (!m_setup) {
            return std::nullopt;
        }
        return m_setup(ctx);
    }

private:
    std::string m_name;
    SetupFn m_setup;
};

} // anonymous namespace

std::unique_ptr<Plugin> make_plugin(std::string name, SetupFn setup) {
    return std::make_unique<FunctionPlugin>(std::move(name), std::move(setup));
}

} // namespace fixi_host
