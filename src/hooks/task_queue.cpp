/// @file task_queue.cpp
/// @brief TaskQueue implementation

#include <fixiplug/hooks/task_queue.hpp>
#include <fixiplug/core/log.hpp>
#include <exception>

namespace fixi_hooks {

void TaskQueue::post(Task task, std::string label) {
    m_tasks.push_back(Entry{std::move(task), std::move(label)});
}

std::size_t TaskQueue::tick() {
    ++m_ticks;

    std::size_t count = m_tasks.size();
    for (std::size_t i = 0; i < count; ++i) {
        Entry entry = std::move(m_tasks.front());
        m_tasks.pop_front();

        try {
            entry.task();
        } catch (const std::exception& e) {
            fixi_core::hooks_logger()->error("Task '{}' failed: {}", entry.label, e.what());
        }
    }
    return count;
}

std::size_t TaskQueue::run_until_idle(std::size_t max_ticks) {
    std::size_t total = 0;
    for (std::size_t i = 0; i < max_ticks && !m_tasks.empty(); ++i) {
        total += tick();
    }
    if (!m_tasks.empty()) {
        fixi_core::hooks_logger()->warn(
            "Task queue still has {} pending tasks after {} ticks", m_tasks.size(), max_ticks);
    }
    return total;
}

} // namespace fixi_hooks
