/// @file deferred_queue.cpp
/// @brief DeferredEventQueue implementation

#include <fixiplug/hooks/deferred_queue.hpp>
#include <fixiplug/core/log.hpp>
#include <algorithm>

namespace fixi_hooks {

EmitOutcome DeferredEventQueue::push(const HookName& hook, Event event) {
    if (m_entries.size() >= m_limits.max_queue) {
        ++m_stats.dropped_overflow;
        // Loud once per hook per drain cycle
        if (m_overflow_hooks.insert(hook).second) {
            fixi_core::hooks_logger()->warn(
                "Deferred queue full ({} entries), dropping event '{}'. "
                "This usually indicates an infinite event loop",
                m_limits.max_queue, hook);
        } else {
            fixi_core::hooks_logger()->debug("Deferred queue full, dropping event '{}'", hook);
        }
        return EmitOutcome::DroppedOverflow;
    }

    std::size_t count = ++m_counts[hook];

    if (count > m_limits.loop_drop_threshold) {
        ++m_stats.dropped_loop;
        if (m_dropping_hooks.insert(hook).second) {
            fixi_core::hooks_logger()->warn(
                "Hook '{}' emitted {} times without the queue draining; dropping further emits",
                hook, count);
        } else {
            fixi_core::hooks_logger()->debug("Dropping looping emit of '{}' (#{})", hook, count);
        }
        return EmitOutcome::DroppedLoop;
    }

    if (count > m_limits.loop_warn_threshold && m_warned_hooks.insert(hook).second) {
        fixi_core::hooks_logger()->warn(
            "Hook '{}' emitted {} times in one drain cycle, possible event loop",
            hook, count);
    }

    m_entries.push_back(DeferredEntry{hook, std::move(event)});
    ++m_stats.enqueued;
    m_stats.peak_size = std::max(m_stats.peak_size, m_entries.size());
    return EmitOutcome::Queued;
}

std::vector<DeferredEntry> DeferredEventQueue::take_batch() {
    std::size_t n = std::min(m_limits.batch_size, m_entries.size());
    std::vector<DeferredEntry> batch;
    batch.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        batch.push_back(std::move(m_entries.front()));
        m_entries.pop_front();
    }
    if (n > 0) {
        ++m_stats.batches;
        m_stats.drained += n;
    }
    return batch;
}

void DeferredEventQueue::reset_counters() {
    m_counts.clear();
    m_warned_hooks.clear();
    m_dropping_hooks.clear();
    m_overflow_hooks.clear();
}

std::size_t DeferredEventQueue::emission_count(const HookName& hook) const {
    auto it = m_counts.find(hook);
    return it != m_counts.end() ? it->second : 0;
}

void DeferredEventQueue::clear() {
    m_entries.clear();
    reset_counters();
}

} // namespace fixi_hooks
