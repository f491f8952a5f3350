#pragma once

/// @file reentrance_guard.hpp
/// @brief Rejects synchronous re-dispatch of a hook from inside its own chain

#include "fwd.hpp"
#include "event.hpp"
#include <cstddef>
#include <optional>
#include <set>
#include <vector>

namespace fixi_hooks {

/// Set of hook names currently being dispatched
class ReentranceGuard {
public:
    /// RAII membership of one hook name in the guard set
    class Scope {
    public:
        Scope(ReentranceGuard& guard, HookName hook);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        Scope(Scope&& other) noexcept;
        Scope& operator=(Scope&&) = delete;

        [[nodiscard]] const HookName& hook() const noexcept { return m_hook; }

    private:
        ReentranceGuard* m_guard;
        HookName m_hook;
    };

    /// Enter a hook; std::nullopt if it is already being dispatched
    [[nodiscard]] std::optional<Scope> try_enter(const HookName& hook);

    [[nodiscard]] bool is_dispatching(const HookName& hook) const;

    [[nodiscard]] std::size_t depth() const noexcept { return m_active.size(); }

    [[nodiscard]] std::vector<HookName> active() const;

private:
    void leave(const HookName& hook);

    std::set<HookName> m_active;
};

} // namespace fixi_hooks
