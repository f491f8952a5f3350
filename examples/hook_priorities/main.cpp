/// @file main.cpp
/// @brief Hook priority demo
///
/// Three plugins attach to "form:submit". Priorities decide the order
/// (validation, then processing, then auditing) regardless of install order.
/// A fourth plugin watches "pluginError" and a deferred emit shows the
/// tick-driven drain.

#include <fixiplug/fixiplug.hpp>

#include <fixiplug/core/log.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

namespace {

using fixi_hooks::Event;
using fixi_hooks::HookName;
using fixi_host::PluginContext;
using Skill = std::optional<fixi_skills::SkillRecord>;

std::unique_ptr<fixi_host::Plugin> validator() {
    return fixi_host::make_plugin("validator", [](PluginContext& ctx) -> Skill {
        ctx.on("form:submit", [](const Event& data, const HookName&) -> std::optional<Event> {
            Event out = data;
            std::string email = data.value("email", "");
            if (email.find('@') == std::string::npos) {
                out["errors"] = Event::array({"Invalid email"});
                out["validated"] = false;
            } else {
                out["validated"] = true;
            }
            return out;
        }, fixi_hooks::priority::HIGH);

        fixi_skills::SkillRecord skill;
        skill.name = "form-validation";
        skill.description = "Rejects submissions without a usable email";
        skill.instructions = "Dispatch form:submit with an 'email' field; check 'errors' on the result.";
        skill.tags = {"forms", "validation"};
        skill.level = "beginner";
        return skill;
    });
}

std::unique_ptr<fixi_host::Plugin> processor() {
    return fixi_host::make_plugin("processor", [](PluginContext& ctx) -> Skill {
        ctx.on("form:submit", [&ctx](const Event& data, const HookName&) -> std::optional<Event> {
            if (data.contains("errors")) {
                FIXI_LOG_INFO("[processor] Skipping, validation failed");
                return std::nullopt;
            }
            Event out = data;
            out["processed"] = true;
            out["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            ctx.emit("form:processed", Event{{"email", data.value("email", "")}});
            return out;
        });
        return std::nullopt;
    });
}

std::unique_ptr<fixi_host::Plugin> audit_logger() {
    return fixi_host::make_plugin("audit-logger", [](PluginContext& ctx) -> Skill {
        ctx.on("form:submit", [](const Event& data, const HookName&) -> std::optional<Event> {
            FIXI_LOG_INFO("[audit] Submission logged: {}", data.value("email", "<none>"));
            return std::nullopt;
        }, fixi_hooks::priority::LOW);

        ctx.on("form:processed", [](const Event& data, const HookName&) -> std::optional<Event> {
            FIXI_LOG_INFO("[audit] Processed later: {}", data.value("email", "<none>"));
            return std::nullopt;
        });
        return std::nullopt;
    });
}

std::unique_ptr<fixi_host::Plugin> error_monitor() {
    return fixi_host::make_plugin("error-monitor", [](PluginContext& ctx) -> Skill {
        ctx.on("pluginError", [](const Event& report, const HookName&) -> std::optional<Event> {
            FIXI_LOG_WARN("[monitor] {} failed on {}: {}",
                report.value("pluginId", "?"),
                report.value("hookName", "?"),
                report.value("error", "?"));
            return std::nullopt;
        });
        return std::nullopt;
    });
}

/// Report an install failure and keep going
void install(fixi_host::PluginHost& host, std::unique_ptr<fixi_host::Plugin> plugin) {
    std::string name = plugin ? plugin->name() : "<null>";
    auto result = host.use(std::move(plugin));
    if (!result) {
        FIXI_LOG_ERROR("Failed to install '{}': {}", name, fixi_core::build_error_chain(result.error()));
    }
}

} // anonymous namespace

int main() {
    fixi_core::LogConfig log_config;
    log_config.level = spdlog::level::info;
    fixi_core::configure_logging(log_config);

    fixi_host::PluginHost host(fixi_host::HostConfig::with_features(fixi_host::feature_sets::CORE));

    // Install order does not matter; priorities do
    install(host, audit_logger());
    install(host, validator());
    install(host, processor());
    install(host, error_monitor());

    auto result = host.dispatch("form:submit", Event{
        {"email", "user@example.com"},
        {"message", "Hello"}});
    FIXI_LOG_INFO("Result: {}", result.dump());

    FIXI_LOG_INFO("--- Invalid submission ---");
    auto rejected = host.dispatch("form:submit", Event{
        {"email", "bad"},
        {"message", "test"}});
    FIXI_LOG_INFO("Result: {}", rejected.dump());

    // A plugin that fails without taking the others down
    install(host, fixi_host::make_plugin("flaky", [](PluginContext& ctx) -> Skill {
        ctx.on("form:submit", [](const Event&, const HookName&) -> std::optional<Event> {
            throw std::runtime_error("flaky handler");
        });
        return std::nullopt;
    }));
    host.dispatch("form:submit", Event{{"email", "again@example.com"}});

    // Deferred emits and error reports run here
    host.run_until_idle();

    FIXI_LOG_INFO("Hooks: {}", host.dispatcher().hooks_snapshot().dump());
    FIXI_LOG_INFO("Skills: {}", host.skills_manifest().dump(2));

    fixi_core::flush_all_loggers();
    return 0;
}
