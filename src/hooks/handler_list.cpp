/// @file handler_list.cpp
/// @brief HandlerList and HookTable implementation

#include <fixiplug/hooks/handler_list.hpp>
#include <algorithm>

namespace fixi_hooks {

// =============================================================================
// HandlerList
// =============================================================================

void HandlerList::insert(HandlerBinding binding) {
    m_bindings.push_back(std::move(binding));

    // Higher priority first; stable so ties keep registration order
    std::stable_sort(m_bindings.begin(), m_bindings.end(),
        [](const HandlerBinding& a, const HandlerBinding& b) {
            return a.priority > b.priority;
        });
}

bool HandlerList::remove(HandlerId id) {
    auto it = std::find_if(m_bindings.begin(), m_bindings.end(),
        [id](const HandlerBinding& b) { return b.id == id; });
    if (it == m_bindings.end()) {
        return false;
    }
    m_bindings.erase(it);
    return true;
}

std::size_t HandlerList::remove_plugin(const std::string& plugin_id) {
    auto before = m_bindings.size();
    m_bindings.erase(
        std::remove_if(m_bindings.begin(), m_bindings.end(),
            [&plugin_id](const HandlerBinding& b) { return b.plugin_id == plugin_id; }),
        m_bindings.end());
    return before - m_bindings.size();
}

// =============================================================================
// HookTable
// =============================================================================

HandlerId HookTable::add(const HookName& hook, const std::string& plugin_id, Handler handler, int priority) {
    HandlerId id(m_next_id++);
    m_lists[hook].insert(HandlerBinding{
        id,
        plugin_id,
        std::make_shared<Handler>(std::move(handler)),
        priority});
    return id;
}

bool HookTable::remove(const HookName& hook, HandlerId id) {
    auto it = m_lists.find(hook);
    if (it == m_lists.end()) {
        return false;
    }
    bool removed = it->second.remove(id);
    if (it->second.empty()) {
        m_lists.erase(it);
    }
    return removed;
}

std::size_t HookTable::remove_plugin(const std::string& plugin_id) {
    std::size_t removed = 0;
    for (auto it = m_lists.begin(); it != m_lists.end();) {
        removed += it->second.remove_plugin(plugin_id);
        if (it->second.empty()) {
            it = m_lists.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<HandlerBinding> HookTable::snapshot(const HookName& hook) const {
    auto it = m_lists.find(hook);
    if (it == m_lists.end()) {
        return {};
    }
    return it->second.bindings();
}

const HandlerList* HookTable::find(const HookName& hook) const {
    auto it = m_lists.find(hook);
    return it != m_lists.end() ? &it->second : nullptr;
}

std::size_t HookTable::handler_count() const {
    std::size_t count = 0;
    for (const auto& [name, list] : m_lists) {
        count += list.size();
    }
    return count;
}

std::size_t HookTable::handler_count(const HookName& hook) const {
    auto* list = find(hook);
    return list ? list->size() : 0;
}

std::size_t HookTable::plugin_handler_count(const std::string& plugin_id) const {
    std::size_t count = 0;
    for (const auto& [name, list] : m_lists) {
        count += static_cast<std::size_t>(std::count_if(list.begin(), list.end(),
            [&plugin_id](const HandlerBinding& b) { return b.plugin_id == plugin_id; }));
    }
    return count;
}

std::vector<HookName> HookTable::hook_names() const {
    std::vector<HookName> names;
    names.reserve(m_lists.size());
    for (const auto& [name, list] : m_lists) {
        names.push_back(name);
    }
    return names;
}

nlohmann::json HookTable::describe() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, list] : m_lists) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& binding : list) {
            entries.push_back({{"plugin", binding.plugin_id}, {"priority", binding.priority}});
        }
        out[name] = std::move(entries);
    }
    return out;
}

} // namespace fixi_hooks
