/// @file plugin_registry.cpp
/// @brief PluginRegistry implementation

#include <fixiplug/hooks/plugin_registry.hpp>
#include <algorithm>

namespace fixi_hooks {

bool PluginRegistry::register_plugin(const std::string& id) {
    auto [it, inserted] = m_records.try_emplace(id, PluginRecord{id, false});
    if (inserted) {
        m_order.push_back(id);
    }
    return inserted;
}

bool PluginRegistry::unregister_plugin(const std::string& id) {
    if (m_records.erase(id) == 0) {
        return false;
    }
    m_order.erase(std::remove(m_order.begin(), m_order.end(), id), m_order.end());
    return true;
}

bool PluginRegistry::set_disabled(const std::string& id, bool disabled) {
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return false;
    }
    it->second.disabled = disabled;
    return true;
}

bool PluginRegistry::is_disabled(const std::string& id) const {
    auto it = m_records.find(id);
    return it != m_records.end() && it->second.disabled;
}

bool PluginRegistry::contains(const std::string& id) const {
    return m_records.find(id) != m_records.end();
}

const PluginRecord* PluginRegistry::find(const std::string& id) const {
    auto it = m_records.find(id);
    return it != m_records.end() ? &it->second : nullptr;
}

std::vector<std::string> PluginRegistry::disabled_ids() const {
    std::vector<std::string> out;
    for (const auto& id : m_order) {
        if (is_disabled(id)) {
            out.push_back(id);
        }
    }
    return out;
}

} // namespace fixi_hooks
