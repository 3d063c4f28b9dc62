/// @file object.cpp
/// @brief UiObject and UiElement implementation for bindery_ui

#include <bindery/ui/object.hpp>
#include <bindery/core/log.hpp>

#include <algorithm>

namespace bindery_ui {

// =============================================================================
// UiObject
// =============================================================================

UiObject::UiObject(std::string name)
    : m_name(std::move(name)) {}

UiObject::~UiObject() {
    // Derived parts are already destroyed; the property store is still intact
    m_attachments.clear();
}

bindery_core::Value UiObject::get_value(const PropertyDescriptor& property) const {
    auto it = m_values.find(property.id());
    if (it != m_values.end()) {
        return it->second;
    }
    return property.metadata_for(*this).default_value;
}

bindery_core::Result<void> UiObject::set_value(const PropertyDescriptor& property, bindery_core::Value value) {
    if (!property.accepts(value)) {
        return bindery_core::Err(bindery_core::Error(bindery_core::BindError::type_mismatch(
            m_name + "." + property.name(),
            bindery_core::value_kind_name(property.value_kind()),
            bindery_core::value_kind_name(bindery_core::kind_of(value)))));
    }

    auto old_value = get_value(property);
    m_values[property.id()] = std::move(value);

    if (old_value != m_values[property.id()]) {
        notify_value_changed(property);
    }
    return bindery_core::Ok();
}

void UiObject::clear_value(const PropertyDescriptor& property) {
    auto it = m_values.find(property.id());
    if (it == m_values.end()) return;

    auto old_value = std::move(it->second);
    m_values.erase(it);

    if (old_value != get_value(property)) {
        notify_value_changed(property);
    }
}

bool UiObject::has_local_value(const PropertyDescriptor& property) const {
    return m_values.find(property.id()) != m_values.end();
}

ListenerToken UiObject::add_value_changed(const PropertyDescriptor& property, ValueChangedCallback callback) {
    ListenerToken token = m_next_token++;
    m_listeners[property.id()].emplace(token, std::move(callback));
    return token;
}

bool UiObject::remove_value_changed(const PropertyDescriptor& property, ListenerToken token) noexcept {
    auto it = m_listeners.find(property.id());
    if (it == m_listeners.end()) return false;

    bool removed = it->second.erase(token) > 0;
    if (it->second.empty()) {
        m_listeners.erase(it);
    }
    return removed;
}

std::size_t UiObject::value_changed_listener_count(const PropertyDescriptor& property) const {
    auto it = m_listeners.find(property.id());
    return it != m_listeners.end() ? it->second.size() : 0;
}

void UiObject::notify_value_changed(const PropertyDescriptor& property) {
    auto it = m_listeners.find(property.id());
    if (it == m_listeners.end()) return;

    // Listeners may add or remove listeners while running
    std::vector<ValueChangedCallback> callbacks;
    callbacks.reserve(it->second.size());
    for (const auto& [token, callback] : it->second) {
        callbacks.push_back(callback);
    }

    for (const auto& callback : callbacks) {
        if (callback) {
            callback(*this);
        }
    }
}

void UiObject::add_logical_child(const UiObjectPtr& child) {
    if (!child || child.get() == this) return;

    auto old_context = child->inherited_context();

    if (auto previous = child->m_parent.lock()) {
        auto& siblings = previous->m_children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), child), siblings.end());
    }

    child->m_parent = weak_from_this();
    m_children.push_back(child);

    bindery_core::ui_logger()->trace("'{}' adopted '{}'", m_name, child->name());

    auto new_context = child->inherited_context();
    if (old_context != new_context) {
        child->on_inherited_context_changed(old_context, new_context);
    }
}

bool UiObject::remove_logical_child(const UiObject& child) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
                           [&child](const UiObjectPtr& c) { return c.get() == &child; });
    if (it == m_children.end()) return false;

    UiObjectPtr removed = *it;
    auto old_context = removed->inherited_context();

    m_children.erase(it);
    removed->m_parent.reset();

    auto new_context = removed->inherited_context();
    if (old_context != new_context) {
        removed->on_inherited_context_changed(old_context, new_context);
    }
    return true;
}

void UiObject::attach(std::shared_ptr<void> attachment) {
    if (attachment) {
        m_attachments.push_back(std::move(attachment));
    }
}

void UiObject::on_inherited_context_changed(const bindery_model::ObjectPtr& old_context,
                                            const bindery_model::ObjectPtr& new_context) {
    propagate_inherited_context(old_context, new_context);
}

void UiObject::propagate_inherited_context(const bindery_model::ObjectPtr& old_context,
                                           const bindery_model::ObjectPtr& new_context) {
    // Copy: handlers may restructure the tree
    auto children = m_children;
    for (const auto& child : children) {
        child->on_inherited_context_changed(old_context, new_context);
    }
}

bindery_model::ObjectPtr UiObject::inherited_context() const {
    for (auto node = m_parent.lock(); node; node = node->m_parent.lock()) {
        const auto* element = dynamic_cast<const UiElement*>(node.get());
        if (element && element->has_local_context()) {
            return element->context();
        }
    }
    return nullptr;
}

// =============================================================================
// UiElement
// =============================================================================

UiElement::UiElement(std::string name)
    : UiObject(std::move(name)) {}

UiElement::~UiElement() = default;

bindery_model::ObjectPtr UiElement::context() const {
    return m_has_local_context ? m_local_context : inherited_context();
}

void UiElement::set_context(bindery_model::ObjectPtr context) {
    auto old_context = this->context();

    m_local_context = std::move(context);
    m_has_local_context = true;

    if (old_context != m_local_context) {
        raise_context_changed(old_context, m_local_context);
        propagate_inherited_context(old_context, m_local_context);
    }
}

void UiElement::clear_context() {
    if (!m_has_local_context) return;

    auto old_context = m_local_context;
    m_local_context.reset();
    m_has_local_context = false;

    auto new_context = context();
    if (old_context != new_context) {
        raise_context_changed(old_context, new_context);
        propagate_inherited_context(old_context, new_context);
    }
}

ListenerToken UiElement::add_context_changed(ContextChangedCallback callback) {
    ListenerToken token = m_next_context_token++;
    m_context_listeners.emplace(token, std::move(callback));
    return token;
}

bool UiElement::remove_context_changed(ListenerToken token) noexcept {
    return m_context_listeners.erase(token) > 0;
}

void UiElement::on_inherited_context_changed(const bindery_model::ObjectPtr& old_context,
                                             const bindery_model::ObjectPtr& new_context) {
    // A local context shadows whatever the ancestors hold
    if (m_has_local_context) return;

    raise_context_changed(old_context, new_context);
    propagate_inherited_context(old_context, new_context);
}

void UiElement::raise_context_changed(const bindery_model::ObjectPtr& old_context,
                                      const bindery_model::ObjectPtr& new_context) {
    bindery_core::ui_logger()->debug("Context of '{}' changed", name());

    std::vector<ContextChangedCallback> callbacks;
    callbacks.reserve(m_context_listeners.size());
    for (const auto& [token, callback] : m_context_listeners) {
        callbacks.push_back(callback);
    }

    for (const auto& callback : callbacks) {
        if (callback) {
            callback(old_context, new_context);
        }
    }
}

} // namespace bindery_ui
