#pragma once

/// @file hooks.hpp
/// @brief Main include header for fixi_hooks
///
/// ## Quick Start
///
/// ```cpp
/// fixi_hooks::Dispatcher hooks;
///
/// hooks.on("beforeRequest", [](const fixi_hooks::Event& e, const fixi_hooks::HookName&) {
///     auto out = e;
///     out["headers"]["x-trace"] = "1";
///     return std::optional<fixi_hooks::Event>(out);
/// }, "tracing", fixi_hooks::priority::HIGH);
///
/// auto event = hooks.dispatch("beforeRequest", {{"url", "/items"}});
///
/// // Deferred emits, error delivery
/// hooks.run_until_idle();
/// ```

#include "fwd.hpp"
#include "event.hpp"
#include "handler_list.hpp"
#include "plugin_registry.hpp"
#include "reentrance_guard.hpp"
#include "error_queue.hpp"
#include "deferred_queue.hpp"
#include "task_queue.hpp"
#include "dispatcher.hpp"

namespace fixi_hooks {

/// Prelude - commonly used types
namespace prelude {
    using fixi_hooks::Event;
    using fixi_hooks::HookName;
    using fixi_hooks::Handler;
    using fixi_hooks::HandlerId;
    using fixi_hooks::Dispatcher;
} // namespace prelude

} // namespace fixi_hooks
