#pragma once

/// @file dispatcher.hpp
/// @brief Named-event dispatcher: priority-ordered handler chains with
/// recursion protection, isolated failures and deferred emission

#include "fwd.hpp"
#include "event.hpp"
#include "handler_list.hpp"
#include "plugin_registry.hpp"
#include "reentrance_guard.hpp"
#include "error_queue.hpp"
#include "deferred_queue.hpp"
#include "task_queue.hpp"
#include <fixiplug/core/config.hpp>
#include <fixiplug/core/error.hpp>
#include <fixiplug/skills/skill_registry.hpp>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fixi_hooks {

// =============================================================================
// DispatchStats
// =============================================================================

struct DispatchStats {
    std::uint64_t dispatches = 0;
    std::uint64_t recursion_rejected = 0;
    std::uint64_t handler_failures = 0;
    std::uint64_t errors_delivered = 0;
    std::uint64_t error_delivery_failures = 0;
};

// =============================================================================
// DispatcherState
// =============================================================================

/// Everything one dispatcher instance mutates
struct DispatcherState {
    fixi_core::DispatcherConfig config;
    HookTable hooks;
    PluginRegistry plugins;
    fixi_skills::SkillRegistry skills;
    ReentranceGuard guard;
    ErrorQueue errors;
    DeferredEventQueue deferred;
    TaskQueue tasks;
    /// A drain task is posted or running
    bool drain_scheduled = false;
    /// An error delivery task is posted
    bool error_delivery_scheduled = false;
    DispatchStats stats;

    explicit DispatcherState(fixi_core::DispatcherConfig cfg);
};

// =============================================================================
// Dispatcher
// =============================================================================

/// Hook dispatcher.
///
/// `dispatch` runs the handlers of a hook, then the "*" handlers, one at a
/// time in descending priority, each seeing the result of the previous one.
/// Handler failures are captured and delivered to the error hook on a later
/// tick. Events raised with `emit` are queued and dispatched in batches on
/// later ticks. Ticks are driven by the owner through `tick()` or
/// `run_until_idle()`.
///
/// Not thread-safe: an instance and its handlers belong to one thread.
class Dispatcher {
public:
    /// Default limits
    Dispatcher();

    /// @throws std::invalid_argument if `config` fails validation
    explicit Dispatcher(fixi_core::DispatcherConfig config);

    ~Dispatcher();

    // Posted tasks capture `this`
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Attach a handler. Registers `plugin_id` if it is not known yet.
    HandlerId on(const HookName& hook, Handler handler, const std::string& plugin_id,
                 int priority = priority::NORMAL);

    /// Detach one handler
    bool off(const HookName& hook, HandlerId id);

    /// Detach every handler of a plugin, across all hooks
    std::size_t remove_plugin_hooks(const std::string& plugin_id);

    // =========================================================================
    // Dispatch
    // =========================================================================

    /// Run the handler chain for `hook` and return the resulting event.
    /// A hook that is already being dispatched returns `event` untouched.
    /// Never throws for handler failures.
    Event dispatch(const HookName& hook, Event event = Event::object());

    /// Queue an event for a later tick. Drops (full queue, looping hook)
    /// are logged only.
    void emit(const HookName& hook, Event event = Event::object());

    // =========================================================================
    // Plugins
    // =========================================================================

    bool register_plugin(const std::string& plugin_id);

    /// Remove the plugin record, its handlers and its skill
    bool unregister_plugin(const std::string& plugin_id);

    fixi_core::Result<void> enable_plugin(const std::string& plugin_id);
    fixi_core::Result<void> disable_plugin(const std::string& plugin_id);

    [[nodiscard]] bool is_disabled(const std::string& plugin_id) const;
    [[nodiscard]] bool has_plugin(const std::string& plugin_id) const;
    [[nodiscard]] const std::vector<std::string>& plugin_ids() const;

    // =========================================================================
    // Skills
    // =========================================================================

    fixi_core::Result<void> register_skill(const std::string& plugin_id, fixi_skills::SkillRecord skill);

    [[nodiscard]] const fixi_skills::SkillRecord* skill(const std::string& name) const;
    [[nodiscard]] std::vector<fixi_skills::SkillRecord> all_skills() const;
    [[nodiscard]] std::vector<fixi_skills::SkillRecord> skills_by_tag(const std::string& tag) const;
    [[nodiscard]] const fixi_skills::SkillRegistry& skills() const;

    // =========================================================================
    // Scheduling
    // =========================================================================

    /// Run one tick of deferred work
    std::size_t tick();

    /// Tick until no deferred work remains
    std::size_t run_until_idle(std::size_t max_ticks = 100000);

    [[nodiscard]] bool has_pending_work() const;

    // =========================================================================
    // Introspection
    // =========================================================================

    /// Hook name -> [{plugin, priority}] without the callables
    [[nodiscard]] nlohmann::json hooks_snapshot() const;

    [[nodiscard]] std::size_t handler_count() const;
    [[nodiscard]] std::size_t handler_count(const HookName& hook) const;

    [[nodiscard]] bool is_dispatching(const HookName& hook) const;

    /// Deferred queue counters (enqueued, drops, batches)
    [[nodiscard]] const QueueStats& queue_stats() const;

    [[nodiscard]] const DeferredEventQueue& deferred() const;
    [[nodiscard]] const ErrorQueue& errors() const;
    [[nodiscard]] const DispatchStats& stats() const;
    [[nodiscard]] const fixi_core::DispatcherConfig& config() const;

private:
    Event run_chain(const std::vector<HandlerBinding>& chain, const HookName& hook, Event event);

    void schedule_error_delivery();
    void deliver_errors();

    void schedule_drain();
    void drain_deferred();

    std::unique_ptr<DispatcherState> m_state;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace fixi_hooks
