#pragma once

/// @file subscription_director.hpp
/// @brief Listen/emit subscription management for one binding
///
/// The director owns at most one listen subscription (endpoint -> target)
/// and at most one emit subscription (target -> endpoint). Both are
/// released together by teardown().

#include "fwd.hpp"
#include "types.hpp"
#include <bindery/core/error.hpp>
#include <bindery/model/fwd.hpp>
#include <bindery/rx/execution_context.hpp>
#include <bindery/rx/subscription.hpp>
#include <bindery/ui/fwd.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace bindery_bind {

// =============================================================================
// TargetSlot
// =============================================================================

/// Property slot on a UI object; the object is held weakly
struct TargetSlot {
    std::weak_ptr<bindery_ui::UiObject> object;
    bindery_ui::PropertyPtr property;

    [[nodiscard]] bindery_ui::UiObjectPtr lock() const { return object.lock(); }

    /// "Object.Property" for diagnostics
    [[nodiscard]] std::string describe() const;
};

// =============================================================================
// SubscriptionDirector
// =============================================================================

/// Installs and releases the subscriptions of one binding
class SubscriptionDirector {
public:
    SubscriptionDirector();
    ~SubscriptionDirector();

    SubscriptionDirector(const SubscriptionDirector&) = delete;
    SubscriptionDirector& operator=(const SubscriptionDirector&) = delete;

    /// Install subscriptions for `mode` (see listens()/emits()).
    /// Existing subscriptions are released first.
    bindery_core::Result<void> setup(const bindery_model::ObjectPtr& endpoint, const TargetSlot& slot,
                                     BindingMode mode, bindery_rx::ExecutionContextPtr context);

    /// Write endpoint elements into the slot on `context`.
    /// The endpoint must expose exactly one observable capability.
    bindery_core::Result<void> setup_listen(const bindery_model::ObjectPtr& endpoint, const TargetSlot& slot,
                                            BindingMode mode, bindery_rx::ExecutionContextPtr context);

    /// Forward slot changes to the endpoint's observer. Silently skipped
    /// (returns false) unless the endpoint accepts the slot's declared kind
    /// and the target is an instance of the property's owner type.
    bool setup_emit(const bindery_model::ObjectPtr& endpoint, const TargetSlot& slot);

    /// Release both subscriptions. Idempotent.
    void teardown() noexcept;

    [[nodiscard]] bool has_listen() const noexcept { return m_listen.is_active(); }
    [[nodiscard]] bool has_emit() const noexcept { return m_emit.is_active(); }

    /// Number of live subscriptions (0..2)
    [[nodiscard]] std::size_t live_count() const noexcept {
        return (has_listen() ? 1u : 0u) + (has_emit() ? 1u : 0u);
    }

    /// Total slot writes delivered by listen subscriptions
    [[nodiscard]] std::uint64_t writes_applied() const noexcept {
        return m_stats->writes.load(std::memory_order_relaxed);
    }

    /// Total values forwarded to endpoints by emit subscriptions
    [[nodiscard]] std::uint64_t values_emitted() const noexcept {
        return m_stats->emitted.load(std::memory_order_relaxed);
    }

private:
    /// Shared with subscription callbacks, which may outlive a setup
    struct Shared {
        std::atomic<std::uint64_t> writes{0};
        std::atomic<std::uint64_t> emitted{0};
        // Thread currently forwarding a slot change to the endpoint; elements
        // the endpoint pushes back synchronously on that thread are echoes
        std::atomic<std::thread::id> emitting{};
        // Thread currently writing an endpoint element into the slot; the
        // resulting slot change is not sent back to the endpoint
        std::atomic<std::thread::id> writing{};
    };

    bindery_rx::Subscription m_listen;
    bindery_rx::Subscription m_emit;
    std::shared_ptr<Shared> m_stats;
};

} // namespace bindery_bind
