#pragma once

/// @file error_queue.hpp
/// @brief Handler failures captured during dispatch, delivered on a later tick

#include "fwd.hpp"
#include "event.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <string>
#include <vector>

namespace fixi_hooks {

/// One failed handler invocation
struct ErrorEntry {
    std::string plugin_id;
    HookName hook_name;
    std::string error;
    /// Accumulated event at the moment the handler failed
    Event event_snapshot;

    /// Payload delivered to error hook subscribers
    [[nodiscard]] Event to_event() const {
        return Event{
            {"pluginId", plugin_id},
            {"hookName", hook_name},
            {"error", error},
            {"event", event_snapshot}};
    }
};

/// FIFO of captured failures
class ErrorQueue {
public:
    void push(ErrorEntry entry) {
        m_entries.push_back(std::move(entry));
        ++m_total_captured;
    }

    /// Take every pending entry in capture order
    [[nodiscard]] std::vector<ErrorEntry> take_all() {
        std::vector<ErrorEntry> out(std::make_move_iterator(m_entries.begin()),
                                    std::make_move_iterator(m_entries.end()));
        m_entries.clear();
        return out;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    /// Entries ever pushed, including those already delivered
    [[nodiscard]] std::uint64_t total_captured() const noexcept { return m_total_captured; }

    void clear() { m_entries.clear(); }

private:
    std::deque<ErrorEntry> m_entries;
    std::uint64_t m_total_captured = 0;
};

} // namespace fixi_hooks
