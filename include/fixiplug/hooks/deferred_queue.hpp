#pragma once

/// @file deferred_queue.hpp
/// @brief Bounded FIFO of events emitted by handlers, with loop detection
///
/// Handlers raise new events through `emit` instead of calling `dispatch`
/// directly. The queue is drained in capped batches on later ticks, which
/// keeps call-stack depth bounded for cross-hook cycles. Per-hook emission
/// counters catch a single hook feeding itself faster than it drains.

#include "fwd.hpp"
#include "event.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <set>
#include <vector>

namespace fixi_hooks {

/// One pending event
struct DeferredEntry {
    HookName hook_name;
    Event event;
};

/// Outcome of a single push
enum class EmitOutcome : std::uint8_t {
    Queued,
    DroppedOverflow,  // Queue at max length
    DroppedLoop,      // Hook exceeded its per-cycle emission limit
};

[[nodiscard]] inline const char* emit_outcome_name(EmitOutcome outcome) {
    switch (outcome) {
        case EmitOutcome::Queued: return "Queued";
        case EmitOutcome::DroppedOverflow: return "DroppedOverflow";
        case EmitOutcome::DroppedLoop: return "DroppedLoop";
        default: return "Unknown";
    }
}

/// Counters for deferred queue activity
struct QueueStats {
    std::uint64_t enqueued = 0;
    std::uint64_t dropped_overflow = 0;
    std::uint64_t dropped_loop = 0;
    std::uint64_t drained = 0;
    std::uint64_t batches = 0;
    std::size_t peak_size = 0;
};

/// Deferred event queue
class DeferredEventQueue {
public:
    struct Limits {
        std::size_t max_queue = 1000;
        std::size_t batch_size = 50;
        std::size_t loop_warn_threshold = 100;
        std::size_t loop_drop_threshold = 500;
    };

    DeferredEventQueue() = default;
    explicit DeferredEventQueue(Limits limits) : m_limits(limits) {}

    /// Enqueue unless the queue is full or the hook is looping.
    /// Drops are logged, never reported to the emitter as errors.
    EmitOutcome push(const HookName& hook, Event event);

    /// Remove up to `batch_size` entries from the front
    [[nodiscard]] std::vector<DeferredEntry> take_batch();

    /// Clear all per-hook emission counters (called once fully drained)
    void reset_counters();

    /// Emissions of `hook` since the last full drain
    [[nodiscard]] std::size_t emission_count(const HookName& hook) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] bool is_full() const noexcept { return m_entries.size() >= m_limits.max_queue; }

    [[nodiscard]] const Limits& limits() const noexcept { return m_limits; }
    [[nodiscard]] const QueueStats& stats() const noexcept { return m_stats; }

    /// Drop pending entries and counters without dispatching them
    void clear();

private:
    Limits m_limits;
    std::deque<DeferredEntry> m_entries;
    std::map<HookName, std::size_t> m_counts;
    std::set<HookName> m_warned_hooks;
    std::set<HookName> m_dropping_hooks;
    std::set<HookName> m_overflow_hooks;
    QueueStats m_stats;
};

} // namespace fixi_hooks
