/// @file reentrance_guard.cpp
/// @brief ReentranceGuard implementation

#include <fixiplug/hooks/reentrance_guard.hpp>

namespace fixi_hooks {

ReentranceGuard::Scope::Scope(ReentranceGuard& guard, HookName hook)
    : m_guard(&guard)
    , m_hook(std::move(hook)) {}

ReentranceGuard::Scope::~Scope() {
    if (m_guard) {
        m_guard->leave(m_hook);
    }
}

ReentranceGuard::Scope::Scope(Scope&& other) noexcept
    : m_guard(other.m_guard)
    , m_hook(std::move(other.m_hook)) {
    other.m_guard = nullptr;
}

std::optional<ReentranceGuard::Scope> ReentranceGuard::try_enter(const HookName& hook) {
    if (!m_active.insert(hook).second) {
        return std::nullopt;
    }
    return std::optional<Scope>(std::in_place, *this, hook);
}

bool ReentranceGuard::is_dispatching(const HookName& hook) const {
    return m_active.count(hook) > 0;
}

std::vector<HookName> ReentranceGuard::active() const {
    return {m_active.begin(), m_active.end()};
}

void ReentranceGuard::leave(const HookName& hook) {
    m_active.erase(hook);
}

} // namespace fixi_hooks
