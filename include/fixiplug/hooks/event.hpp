#pragma once

/// @file event.hpp
/// @brief Event, handler and identifier types shared by the hook dispatcher

#include "fwd.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace fixi_hooks {

// =============================================================================
// Event
// =============================================================================

/// Event payload: an open key-value document threaded through handlers
using Event = nlohmann::json;

/// Hook identifier
using HookName = std::string;

/// Reserved hook name whose handlers run for every dispatch
inline constexpr const char* k_wildcard_hook = "*";

/// Default hook that receives captured handler failures
inline constexpr const char* k_plugin_error_hook = "pluginError";

// =============================================================================
// Priority
// =============================================================================

/// Conventional priorities (higher runs first; any int is accepted)
namespace priority {
    inline constexpr int HIGH = 100;
    inline constexpr int NORMAL = 0;
    inline constexpr int LOW = -100;
} // namespace priority

// =============================================================================
// Handler
// =============================================================================

/// Hook handler. Returning std::nullopt keeps the current event;
/// returning a value replaces it for the remaining handlers.
using Handler = std::function<std::optional<Event>(const Event& event, const HookName& hook)>;

/// Identity of one registered binding (returned by `on`, consumed by `off`)
struct HandlerId {
    std::uint64_t id = 0;

    constexpr HandlerId() = default;
    constexpr explicit HandlerId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const HandlerId&) const noexcept = default;
    constexpr bool operator==(const HandlerId&) const noexcept = default;
};

} // namespace fixi_hooks
