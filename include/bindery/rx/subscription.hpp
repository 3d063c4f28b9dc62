#pragma once

/// @file subscription.hpp
/// @brief RAII subscription handle for bindery_rx

#include "fwd.hpp"
#include <functional>

namespace bindery_rx {

// =============================================================================
// Subscription
// =============================================================================

/// Move-only handle that runs its release action exactly once.
/// Disposal happens explicitly through dispose() or on destruction.
class Subscription {
public:
    Subscription() = default;

    explicit Subscription(std::function<void()> on_dispose)
        : m_on_dispose(std::move(on_dispose)) {}

    ~Subscription() { dispose(); }

    Subscription(Subscription&& other) noexcept
        : m_on_dispose(std::move(other.m_on_dispose)) {
        other.m_on_dispose = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            dispose();
            m_on_dispose = std::move(other.m_on_dispose);
            other.m_on_dispose = nullptr;
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    /// Run the release action if still pending. Idempotent, never throws.
    void dispose() noexcept;

    /// True until disposed or released
    [[nodiscard]] bool is_active() const noexcept { return static_cast<bool>(m_on_dispose); }

    explicit operator bool() const noexcept { return is_active(); }

    /// Give up ownership without releasing
    std::function<void()> release() noexcept {
        auto action = std::move(m_on_dispose);
        m_on_dispose = nullptr;
        return action;
    }

private:
    std::function<void()> m_on_dispose;
};

} // namespace bindery_rx
