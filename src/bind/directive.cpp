/// @file directive.cpp
/// @brief BindingDirective lifecycle

#include <bindery/bind/directive.hpp>
#include <bindery/bind/settings.hpp>
#include <bindery/core/log.hpp>
#include <bindery/model/object.hpp>
#include <bindery/ui/object.hpp>
#include <bindery/ui/property.hpp>

namespace bindery_bind {

using bindery_core::BindError;
using bindery_core::Err;
using bindery_core::Error;

// =============================================================================
// Construction
// =============================================================================

bindery_core::Result<BindingDirectivePtr> BindingDirective::create(std::string_view path_text, BindingMode mode,
                                                                  DirectiveOptions options) {
    auto path = PropertyPath::parse(path_text);
    if (!path) {
        bindery_core::debug::record_error(path.error());
        return Err<BindingDirectivePtr>(path.error());
    }

    if (!options.locator) {
        options.locator = bindery_ui::default_context_locator();
    }

    return bindery_core::Ok(std::make_shared<BindingDirective>(
        PrivateTag{}, std::move(path).value(), mode, std::move(options)));
}

BindingDirective::BindingDirective(PrivateTag, PropertyPath path, BindingMode mode, DirectiveOptions options)
    : m_path(std::move(path))
    , m_mode(mode)
    , m_options(std::move(options)) {}

BindingDirective::~BindingDirective() {
    detach_context_listener();
    m_director.teardown();
}

// =============================================================================
// Instantiation
// =============================================================================

bindery_core::Result<bindery_core::Value> BindingDirective::provide_value(const ProvideValueTarget& target) {
    auto logger = bindery_core::bind_logger();

    if (m_state != DirectiveState::Unattached) {
        return Err<bindery_core::Value>(Error(BindError::invalid_target(
            "directive for '" + m_path.text() + "' is already attached")));
    }

    if (!target.target_object || !target.target_property) {
        return Err<bindery_core::Value>(Error(BindError::invalid_target("missing target object or property")));
    }

    TargetSlot slot{target.target_object, target.target_property};

    auto source = m_options.locator->find_context_source(*target.target_object);
    if (!source) {
        Error error(BindError::no_context_source(slot.describe()));
        bindery_core::debug::record_error(error);
        return Err<bindery_core::Value>(std::move(error));
    }

    // Restored if instantiation fails, so the directive stays Unattached
    const BindingMode requested_mode = m_mode;
    const bool captured_context = !m_options.execution_context;

    m_slot = std::move(slot);
    if (captured_context) {
        m_options.execution_context = bindery_rx::ExecutionContext::current();
    }

    std::weak_ptr<BindingDirective> weak_self = weak_from_this();
    m_context_source = source;
    m_context_listener = source->add_context_changed(
        [weak_self](const bindery_model::ObjectPtr&, const bindery_model::ObjectPtr& new_context) {
            if (auto self = weak_self.lock()) {
                self->on_context_changed(new_context);
            }
        });

    auto result = setup_binding(source->context());
    if (!result) {
        detach_context_listener();
        m_director.teardown();
        m_state = DirectiveState::Unattached;
        m_slot = TargetSlot{};
        m_mode = requested_mode;
        if (captured_context) {
            m_options.execution_context.reset();
        }
        bindery_core::debug::record_error(result.error());
        return Err<bindery_core::Value>(result.error());
    }

    target.target_object->attach(shared_from_this());

    logger->debug("Directive '{}' attached to '{}' via '{}' ({})", m_path.text(), m_slot.describe(),
                  source->name(), directive_state_name(m_state));

    return bindery_core::Ok(target.target_property->metadata_for(*target.target_object).default_value);
}

// =============================================================================
// Context Changes
// =============================================================================

void BindingDirective::on_context_changed(const bindery_model::ObjectPtr& new_context) {
    BINDERY_LOG_SCOPE("context change for '" + m_path.text() + "'", "bindery_bind");
    ++m_context_changes;

    m_director.teardown();
    m_state = DirectiveState::Inert;

    if (!new_context) {
        bindery_core::bind_logger()->debug("Context cleared for '{}' on '{}'", m_path.text(), m_slot.describe());
        return;
    }

    auto result = setup_binding(new_context);
    if (!result) {
        m_director.teardown();
        m_state = DirectiveState::Inert;
        bindery_core::debug::record_error(result.error());
        bindery_core::bind_logger()->error("Binding '{}' on '{}' failed: {}", m_path.text(), m_slot.describe(),
                                           result.error().message());
    }
}

bindery_core::Result<void> BindingDirective::setup_binding(const bindery_model::ObjectPtr& context) {
    auto logger = bindery_core::bind_logger();

    m_state = DirectiveState::Inert;

    auto target = m_slot.lock();
    if (!target) {
        return bindery_core::Ok();
    }

    auto endpoint = resolve_path(context, m_path);
    if (!endpoint) {
        logger->debug("Path '{}' unresolved for '{}'; binding inert", m_path.text(), m_slot.describe());
        return bindery_core::Ok();
    }

    auto mode = resolve_mode(*target);
    auto result = m_director.setup(endpoint, m_slot, mode, m_options.execution_context);
    if (!result) {
        return result;
    }

    m_state = DirectiveState::Bound;
    logger->debug("Bound '{}' -> '{}' as {} (listen: {}, emit: {})", m_path.text(), m_slot.describe(),
                  binding_mode_name(mode), m_director.has_listen(), m_director.has_emit());
    return bindery_core::Ok();
}

BindingMode BindingDirective::resolve_mode(bindery_ui::UiObject& target) {
    if (m_mode != BindingMode::Default) {
        return m_mode;
    }

    if (auto configured = default_mode_override()) {
        m_mode = *configured;
    } else if (m_slot.property->metadata_for(target).binds_two_way_by_default) {
        m_mode = BindingMode::TwoWay;
    } else {
        m_mode = BindingMode::OneWay;
    }

    bindery_core::bind_logger()->trace("Mode for '{}' resolved to {}", m_slot.describe(), binding_mode_name(m_mode));
    return m_mode;
}

void BindingDirective::detach_context_listener() noexcept {
    if (!m_context_listener) return;

    if (auto source = m_context_source.lock()) {
        source->remove_context_changed(*m_context_listener);
    }
    m_context_listener.reset();
    m_context_source.reset();
}

// =============================================================================
// Convenience
// =============================================================================

bindery_core::Result<BindingDirectivePtr> bind(const bindery_ui::UiObjectPtr& target,
                                               const bindery_ui::PropertyPtr& property,
                                               std::string_view path, BindingMode mode,
                                               DirectiveOptions options) {
    auto directive = BindingDirective::create(path, mode, std::move(options));
    if (!directive) {
        return directive;
    }

    auto provided = directive.value()->provide_value(ProvideValueTarget{target, property});
    if (!provided) {
        return Err<BindingDirectivePtr>(provided.error());
    }
    return directive;
}

} // namespace bindery_bind
