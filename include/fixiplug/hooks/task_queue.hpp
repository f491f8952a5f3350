#pragma once

/// @file task_queue.hpp
/// @brief Deterministic "next tick" scheduler
///
/// Work posted here never runs inside the call that posted it. The owner
/// drives the queue explicitly, one tick at a time, which makes batch sizes
/// and drain order reproducible in tests.

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>

namespace fixi_hooks {

class TaskQueue {
public:
    using Task = std::function<void()>;

    /// Schedule a task for a later tick; `label` is used in log messages
    void post(Task task, std::string label = {});

    /// Run the tasks that were pending when the tick began.
    /// Tasks posted while ticking wait for the next tick.
    /// @return Number of tasks run
    std::size_t tick();

    /// Tick until nothing is pending or `max_ticks` is reached
    /// @return Number of tasks run
    std::size_t run_until_idle(std::size_t max_ticks = 100000);

    [[nodiscard]] std::size_t pending() const noexcept { return m_tasks.size(); }
    [[nodiscard]] bool idle() const noexcept { return m_tasks.empty(); }
    [[nodiscard]] std::uint64_t ticks() const noexcept { return m_ticks; }

    void clear() { m_tasks.clear(); }

private:
    struct Entry {
        Task task;
        std::string label;
    };

    std::deque<Entry> m_tasks;
    std::uint64_t m_ticks = 0;
};

} // namespace fixi_hooks
