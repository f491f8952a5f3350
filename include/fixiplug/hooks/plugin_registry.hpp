#pragma once

/// @file plugin_registry.hpp
/// @brief Plugin identity and enabled/disabled state

#include "fwd.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace fixi_hooks {

// =============================================================================
// PluginRecord
// =============================================================================

/// A known plugin. Disabling keeps its handlers registered but skipped.
struct PluginRecord {
    std::string id;
    bool disabled = false;
};

// =============================================================================
// PluginRegistry
// =============================================================================

/// Plugin records in registration order
class PluginRegistry {
public:
    /// Create a record if absent; returns true if one was created
    bool register_plugin(const std::string& id);

    /// Remove the record; returns false if it was unknown
    bool unregister_plugin(const std::string& id);

    /// Set the disabled flag; returns false if the plugin is unknown
    bool set_disabled(const std::string& id, bool disabled);

    /// Unknown plugins are never disabled
    [[nodiscard]] bool is_disabled(const std::string& id) const;

    [[nodiscard]] bool contains(const std::string& id) const;

    [[nodiscard]] const PluginRecord* find(const std::string& id) const;

    /// Ids in registration order
    [[nodiscard]] const std::vector<std::string>& ids() const noexcept { return m_order; }

    [[nodiscard]] std::vector<std::string> disabled_ids() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_records.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_records.empty(); }

private:
    std::map<std::string, PluginRecord> m_records;
    std::vector<std::string> m_order;
};

} // namespace fixi_hooks
