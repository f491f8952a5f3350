#pragma once

/// @file handler_list.hpp
/// @brief Priority-ordered handler lists, one per hook name

#include "fwd.hpp"
#include "event.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fixi_hooks {

// =============================================================================
// HandlerBinding
// =============================================================================

/// One handler attached to one hook name
struct HandlerBinding {
    HandlerId id;
    std::string plugin_id;
    /// Shared so that dispatch snapshots invoke the same callable object
    std::shared_ptr<Handler> handler;
    int priority = 0;
};

// =============================================================================
// HandlerList
// =============================================================================

/// Bindings of a single hook, kept sorted by descending priority.
/// Equal priorities keep their registration order.
class HandlerList {
public:
    /// Append and re-sort (stable)
    void insert(HandlerBinding binding);

    /// Remove the first binding with this id
    bool remove(HandlerId id);

    /// Remove every binding owned by a plugin; returns how many were removed
    std::size_t remove_plugin(const std::string& plugin_id);

    [[nodiscard]] const std::vector<HandlerBinding>& bindings() const noexcept { return m_bindings; }
    [[nodiscard]] std::size_t size() const noexcept { return m_bindings.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_bindings.empty(); }

    [[nodiscard]] auto begin() const noexcept { return m_bindings.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_bindings.end(); }

private:
    std::vector<HandlerBinding> m_bindings;
};

// =============================================================================
// HookTable
// =============================================================================

/// Handler lists for every hook name, including the "*" wildcard list
class HookTable {
public:
    HookTable() : m_next_id(1) {}

    /// Register a handler; returns the id used to remove it again
    HandlerId add(const HookName& hook, const std::string& plugin_id, Handler handler, int priority = 0);

    /// Remove one binding from one hook
    bool remove(const HookName& hook, HandlerId id);

    /// Remove a plugin's bindings from every hook
    std::size_t remove_plugin(const std::string& plugin_id);

    /// Copy of a hook's bindings (empty if the hook has none)
    [[nodiscard]] std::vector<HandlerBinding> snapshot(const HookName& hook) const;

    [[nodiscard]] const HandlerList* find(const HookName& hook) const;

    [[nodiscard]] std::size_t handler_count() const;
    [[nodiscard]] std::size_t handler_count(const HookName& hook) const;

    /// Number of bindings a plugin owns across all hooks
    [[nodiscard]] std::size_t plugin_handler_count(const std::string& plugin_id) const;

    [[nodiscard]] std::vector<HookName> hook_names() const;

    /// Hook name -> [{plugin, priority}] in execution order, without callables
    [[nodiscard]] nlohmann::json describe() const;

    void clear() { m_lists.clear(); }

private:
    std::map<HookName, HandlerList> m_lists;
    std::uint64_t m_next_id;
};

} // namespace fixi_hooks
