#pragma once

/// @file directive.hpp
/// @brief Declarative binding entry point
///
/// A BindingDirective is created from a path and a mode, then instantiated
/// once against a target slot with provide_value(). From then on it follows
/// the context object of the nearest context holder: every replacement tears
/// the subscriptions down and, if the new context yields an endpoint for the
/// path, sets them up again. The directive lives as long as its target.

#include "fwd.hpp"
#include "path.hpp"
#include "subscription_director.hpp"
#include "types.hpp"
#include <bindery/core/error.hpp>
#include <bindery/core/value.hpp>
#include <bindery/model/fwd.hpp>
#include <bindery/rx/execution_context.hpp>
#include <bindery/ui/context_locator.hpp>
#include <bindery/ui/fwd.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace bindery_bind {

/// Target slot handed over by the template instantiation
struct ProvideValueTarget {
    bindery_ui::UiObjectPtr target_object;
    bindery_ui::PropertyPtr target_property;
};

/// Host services used by a directive; null members fall back to defaults
struct DirectiveOptions {
    /// Null: LogicalTreeContextLocator
    std::shared_ptr<const bindery_ui::IContextLocator> locator;

    /// Null: the instantiating thread's current execution context
    bindery_rx::ExecutionContextPtr execution_context;
};

// =============================================================================
// BindingDirective
// =============================================================================

class BindingDirective : public std::enable_shared_from_this<BindingDirective> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Create an unattached directive. Empty or malformed paths are rejected.
    [[nodiscard]] static bindery_core::Result<BindingDirectivePtr> create(
        std::string_view path_text, BindingMode mode = BindingMode::Default, DirectiveOptions options = {});

    /// Use create()
    BindingDirective(PrivateTag, PropertyPath path, BindingMode mode, DirectiveOptions options);
    ~BindingDirective();

    BindingDirective(const BindingDirective&) = delete;
    BindingDirective& operator=(const BindingDirective&) = delete;

    /// Instantiate against `target`. Returns the slot's default value right
    /// away; streamed values arrive later on the execution context.
    /// A directive can be instantiated once; a failed attempt leaves it
    /// Unattached and may be retried.
    [[nodiscard]] bindery_core::Result<bindery_core::Value> provide_value(const ProvideValueTarget& target);

    // =========================================================================
    // Diagnostics
    // =========================================================================

    [[nodiscard]] DirectiveState state() const noexcept { return m_state; }

    /// Effective mode; Default until first resolved against an endpoint
    [[nodiscard]] BindingMode mode() const noexcept { return m_mode; }

    [[nodiscard]] const PropertyPath& path() const noexcept { return m_path; }

    [[nodiscard]] const SubscriptionDirector& director() const noexcept { return m_director; }

    /// Number of context replacements seen since instantiation
    [[nodiscard]] std::uint64_t context_changes() const noexcept { return m_context_changes; }

private:
    void on_context_changed(const bindery_model::ObjectPtr& new_context);

    /// Resolve the path against `context` and install subscriptions
    bindery_core::Result<void> setup_binding(const bindery_model::ObjectPtr& context);

    /// Settle Default into a concrete mode; runs at most once
    BindingMode resolve_mode(bindery_ui::UiObject& target);

    void detach_context_listener() noexcept;

    PropertyPath m_path;
    BindingMode m_mode;
    DirectiveOptions m_options;

    DirectiveState m_state{DirectiveState::Unattached};
    TargetSlot m_slot;
    SubscriptionDirector m_director;

    std::weak_ptr<bindery_ui::UiElement> m_context_source;
    std::optional<bindery_ui::ListenerToken> m_context_listener;
    std::uint64_t m_context_changes{0};
};

/// Create a directive for `path` and instantiate it on (target, property)
[[nodiscard]] bindery_core::Result<BindingDirectivePtr> bind(const bindery_ui::UiObjectPtr& target,
                                                             const bindery_ui::PropertyPtr& property,
                                                             std::string_view path,
                                                             BindingMode mode = BindingMode::Default,
                                                             DirectiveOptions options = {});

} // namespace bindery_bind
