/// @file dispatcher.cpp
/// @brief Dispatcher implementation

#include <fixiplug/hooks/dispatcher.hpp>
#include <fixiplug/core/log.hpp>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace fixi_hooks {

namespace {

DeferredEventQueue::Limits limits_from(const fixi_core::DispatcherConfig& config) {
    DeferredEventQueue::Limits limits;
    limits.max_queue = config.max_queue;
    limits.batch_size = config.batch_size;
    limits.loop_warn_threshold = config.loop_warn_threshold;
    limits.loop_drop_threshold = config.loop_drop_threshold;
    return limits;
}

const fixi_core::DispatcherConfig& checked(const fixi_core::DispatcherConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        throw std::invalid_argument(valid.error().message());
    }
    return config;
}

} // anonymous namespace

// =============================================================================
// DispatcherState
// =============================================================================

DispatcherState::DispatcherState(fixi_core::DispatcherConfig cfg)
    : config(std::move(cfg))
    , deferred(limits_from(config)) {}

// =============================================================================
// Dispatcher
// =============================================================================

Dispatcher::Dispatcher()
    : Dispatcher(fixi_core::DispatcherConfig{}) {}

Dispatcher::Dispatcher(fixi_core::DispatcherConfig config)
    : m_state(std::make_unique<DispatcherState>(checked(config)))
    , m_log(fixi_core::hooks_logger()) {}

Dispatcher::~Dispatcher() {
    // Pending tasks reference this instance
    m_state->tasks.clear();
}

HandlerId Dispatcher::on(const HookName& hook, Handler handler, const std::string& plugin_id, int priority) {
    m_state->plugins.register_plugin(plugin_id);
    auto id = m_state->hooks.add(hook, plugin_id, std::move(handler), priority);
    m_log->trace("Handler {} of '{}' attached to '{}' (priority {})", id.id, plugin_id, hook, priority);
    return id;
}

bool Dispatcher::off(const HookName& hook, HandlerId id) {
    return m_state->hooks.remove(hook, id);
}

std::size_t Dispatcher::remove_plugin_hooks(const std::string& plugin_id) {
    return m_state->hooks.remove_plugin(plugin_id);
}

// =============================================================================
// Dispatch
// =============================================================================

Event Dispatcher::dispatch(const HookName& hook, Event event) {
    auto& s = *m_state;

    auto scope = s.guard.try_enter(hook);
    if (!scope) {
        ++s.stats.recursion_rejected;
        m_log->warn("Recursive dispatch of '{}' skipped", hook);
        return event;
    }
    ++s.stats.dispatches;

    auto chain = s.hooks.snapshot(hook);
    if (hook != k_wildcard_hook) {
        auto wildcard = s.hooks.snapshot(k_wildcard_hook);
        chain.insert(chain.end(), std::make_move_iterator(wildcard.begin()),
                     std::make_move_iterator(wildcard.end()));
    }

    Event result = run_chain(chain, hook, std::move(event));
    scope.reset();

    if (!s.errors.empty()) {
        schedule_error_delivery();
    }
    if (!s.deferred.empty()) {
        schedule_drain();
    }
    return result;
}

Event Dispatcher::run_chain(const std::vector<HandlerBinding>& chain, const HookName& hook, Event event) {
    auto& s = *m_state;

    for (const auto& binding : chain) {
        // Disabled state is read live so handlers may toggle later plugins
        if (s.plugins.is_disabled(binding.plugin_id)) {
            continue;
        }

        std::string failure;
        try {
            auto out = (*binding.handler)(event, hook);
            if (out) {
                event = std::move(*out);
            }
            continue;
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "unknown exception";
        }

        ++s.stats.handler_failures;
        m_log->error("Handler of plugin '{}' failed on '{}': {}", binding.plugin_id, hook, failure);
        s.errors.push(ErrorEntry{binding.plugin_id, hook, std::move(failure), event});
    }

    return event;
}

void Dispatcher::emit(const HookName& hook, Event event) {
    auto outcome = m_state->deferred.push(hook, std::move(event));
    if (outcome == EmitOutcome::Queued) {
        schedule_drain();
    }
}

// =============================================================================
// Error Delivery
// =============================================================================

void Dispatcher::schedule_error_delivery() {
    auto& s = *m_state;
    if (s.error_delivery_scheduled) {
        return;
    }
    s.error_delivery_scheduled = true;
    s.tasks.post([this] { deliver_errors(); }, "error-delivery");
}

void Dispatcher::deliver_errors() {
    auto& s = *m_state;
    s.error_delivery_scheduled = false;

    const HookName& error_hook = s.config.error_hook;
    for (const auto& entry : s.errors.take_all()) {
        auto subscribers = s.hooks.snapshot(error_hook);
        if (subscribers.empty()) {
            m_log->debug("No '{}' subscribers for failure of '{}' on '{}'",
                         error_hook, entry.plugin_id, entry.hook_name);
            continue;
        }

        Event payload = entry.to_event();
        for (const auto& binding : subscribers) {
            if (s.plugins.is_disabled(binding.plugin_id)) {
                continue;
            }
            try {
                (*binding.handler)(payload, error_hook);
                ++s.stats.errors_delivered;
            } catch (const std::exception& e) {
                ++s.stats.error_delivery_failures;
                m_log->error("'{}' handler of plugin '{}' failed: {}", error_hook, binding.plugin_id, e.what());
            } catch (...) {
                ++s.stats.error_delivery_failures;
                m_log->error("'{}' handler of plugin '{}' failed: unknown exception",
                             error_hook, binding.plugin_id);
            }
        }
    }
}

// =============================================================================
// Deferred Drain
// =============================================================================

void Dispatcher::schedule_drain() {
    auto& s = *m_state;
    if (s.drain_scheduled) {
        return;
    }
    s.drain_scheduled = true;
    s.tasks.post([this] { drain_deferred(); }, "deferred-drain");
}

void Dispatcher::drain_deferred() {
    auto& s = *m_state;

    auto batch = s.deferred.take_batch();
    for (auto& entry : batch) {
        dispatch(entry.hook_name, std::move(entry.event));
    }

    if (!s.deferred.empty()) {
        s.tasks.post([this] { drain_deferred(); }, "deferred-drain");
        return;
    }

    s.drain_scheduled = false;
    s.deferred.reset_counters();
    m_log->trace("Deferred queue drained");
}

// =============================================================================
// Plugins
// =============================================================================

bool Dispatcher::register_plugin(const std::string& plugin_id) {
    return m_state->plugins.register_plugin(plugin_id);
}

bool Dispatcher::unregister_plugin(const std::string& plugin_id) {
    auto& s = *m_state;
    bool had_record = s.plugins.unregister_plugin(plugin_id);
    std::size_t removed = s.hooks.remove_plugin(plugin_id);
    bool had_skill = s.skills.unregister_skill(plugin_id);

    if (had_record || removed > 0 || had_skill) {
        m_log->debug("Unregistered plugin '{}' ({} handlers)", plugin_id, removed);
        return true;
    }
    return false;
}

fixi_core::Result<void> Dispatcher::enable_plugin(const std::string& plugin_id) {
    if (!m_state->plugins.set_disabled(plugin_id, false)) {
        m_log->error("Cannot enable unknown plugin '{}'", plugin_id);
        return fixi_core::Err(fixi_core::PluginError::not_found(plugin_id));
    }
    m_log->info("Enabled plugin '{}'", plugin_id);
    return fixi_core::Ok();
}

fixi_core::Result<void> Dispatcher::disable_plugin(const std::string& plugin_id) {
    if (!m_state->plugins.set_disabled(plugin_id, true)) {
        m_log->error("Cannot disable unknown plugin '{}'", plugin_id);
        return fixi_core::Err(fixi_core::PluginError::not_found(plugin_id));
    }
    m_log->info("Disabled plugin '{}'", plugin_id);
    return fixi_core::Ok();
}

bool Dispatcher::is_disabled(const std::string& plugin_id) const {
    return m_state->plugins.is_disabled(plugin_id);
}

bool Dispatcher::has_plugin(const std::string& plugin_id) const {
    return m_state->plugins.contains(plugin_id);
}

const std::vector<std::string>& Dispatcher::plugin_ids() const {
    return m_state->plugins.ids();
}

// =============================================================================
// Skills
// =============================================================================

fixi_core::Result<void> Dispatcher::register_skill(const std::string& plugin_id, fixi_skills::SkillRecord skill) {
    return m_state->skills.register_skill(plugin_id, std::move(skill));
}

const fixi_skills::SkillRecord* Dispatcher::skill(const std::string& name) const {
    return m_state->skills.skill(name);
}

std::vector<fixi_skills::SkillRecord> Dispatcher::all_skills() const {
    return m_state->skills.all_skills();
}

std::vector<fixi_skills::SkillRecord> Dispatcher::skills_by_tag(const std::string& tag) const {
    return m_state->skills.skills_by_tag(tag);
}

const fixi_skills::SkillRegistry& Dispatcher::skills() const {
    return m_state->skills;
}

// =============================================================================
// Scheduling
// =============================================================================

std::size_t Dispatcher::tick() {
    return m_state->tasks.tick();
}

std::size_t Dispatcher::run_until_idle(std::size_t max_ticks) {
    return m_state->tasks.run_until_idle(max_ticks);
}

bool Dispatcher::has_pending_work() const {
    return !m_state->tasks.idle();
}

// =============================================================================
// Introspection
// =============================================================================

nlohmann::json Dispatcher::hooks_snapshot() const {
    return m_state->hooks.describe();
}

std::size_t Dispatcher::handler_count() const {
    return m_state->hooks.handler_count();
}

std::size_t Dispatcher::handler_count(const HookName& hook) const {
    return m_state->hooks.handler_count(hook);
}

bool Dispatcher::is_dispatching(const HookName& hook) const {
    return m_state->guard.is_dispatching(hook);
}

const QueueStats& Dispatcher::queue_stats() const {
    return m_state->deferred.stats();
}

const DeferredEventQueue& Dispatcher::deferred() const {
    return m_state->deferred;
}

const ErrorQueue& Dispatcher::errors() const {
    return m_state->errors;
}

const DispatchStats& Dispatcher::stats() const {
    return m_state->stats;
}

const fixi_core::DispatcherConfig& Dispatcher::config() const {
    return m_state->config;
}

} // namespace fixi_hooks
