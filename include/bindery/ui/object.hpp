#pragma once

/// @file object.hpp
/// @brief UI objects: property store, logical tree and context holders
///
/// UiObject is the host-side object whose property slots bindings write to.
/// UiElement additionally carries a context object that descendants inherit
/// unless they set their own.

#include "fwd.hpp"
#include "property.hpp"
#include <bindery/core/error.hpp>
#include <bindery/core/value.hpp>
#include <bindery/model/fwd.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace bindery_ui {

// =============================================================================
// UiObject
// =============================================================================

/// Object with typed property slots and change notification
class UiObject : public std::enable_shared_from_this<UiObject> {
public:
    using ValueChangedCallback = std::function<void(const UiObject& sender)>;

    explicit UiObject(std::string name = "UiObject");
    virtual ~UiObject();

    UiObject(const UiObject&) = delete;
    UiObject& operator=(const UiObject&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    // =========================================================================
    // Property Values
    // =========================================================================

    /// Current value: the local value if set, else the metadata default
    [[nodiscard]] bindery_core::Value get_value(const PropertyDescriptor& property) const;

    /// Typed read; falls back to T{} if the stored kind differs
    template<typename T>
    [[nodiscard]] T get(const PropertyDescriptor& property) const {
        auto value = get_value(property);
        if (const auto* typed = std::get_if<T>(&value)) {
            return *typed;
        }
        return T{};
    }

    /// Store a local value. Listeners run only if the effective value changed.
    /// Values of a kind other than the declared one are rejected.
    bindery_core::Result<void> set_value(const PropertyDescriptor& property, bindery_core::Value value);

    /// Remove the local value, reverting to the default
    void clear_value(const PropertyDescriptor& property);

    [[nodiscard]] bool has_local_value(const PropertyDescriptor& property) const;

    // =========================================================================
    // Change Notification
    // =========================================================================

    /// Register a listener for changes of `property` on this object
    ListenerToken add_value_changed(const PropertyDescriptor& property, ValueChangedCallback callback);

    /// Remove a listener; unknown tokens are ignored
    bool remove_value_changed(const PropertyDescriptor& property, ListenerToken token) noexcept;

    [[nodiscard]] std::size_t value_changed_listener_count(const PropertyDescriptor& property) const;

    // =========================================================================
    // Logical Tree
    // =========================================================================

    [[nodiscard]] UiObjectPtr logical_parent() const { return m_parent.lock(); }

    [[nodiscard]] const std::vector<UiObjectPtr>& logical_children() const noexcept { return m_children; }

    /// Adopt a child; it leaves its previous parent
    void add_logical_child(const UiObjectPtr& child);

    /// Release a child
    bool remove_logical_child(const UiObject& child);

    // =========================================================================
    // Attachments
    // =========================================================================

    /// Keep an object alive for as long as this UiObject lives
    void attach(std::shared_ptr<void> attachment);

    [[nodiscard]] std::size_t attachment_count() const noexcept { return m_attachments.size(); }

protected:
    /// Called on this object and its descendants when the context they
    /// inherit changed
    virtual void on_inherited_context_changed(const bindery_model::ObjectPtr& old_context,
                                              const bindery_model::ObjectPtr& new_context);

    void propagate_inherited_context(const bindery_model::ObjectPtr& old_context,
                                     const bindery_model::ObjectPtr& new_context);

    /// Context inherited from the nearest ancestor element
    [[nodiscard]] bindery_model::ObjectPtr inherited_context() const;

    void notify_value_changed(const PropertyDescriptor& property);

private:
    std::string m_name;
    std::map<std::uint64_t, bindery_core::Value> m_values;
    std::map<std::uint64_t, std::map<ListenerToken, ValueChangedCallback>> m_listeners;
    ListenerToken m_next_token{1};

    std::weak_ptr<UiObject> m_parent;
    std::vector<UiObjectPtr> m_children;

    std::vector<std::shared_ptr<void>> m_attachments;
};

// =============================================================================
// UiElement
// =============================================================================

/// UiObject that holds a context object for bindings
class UiElement : public UiObject {
public:
    using ContextChangedCallback = std::function<void(const bindery_model::ObjectPtr& old_context,
                                                      const bindery_model::ObjectPtr& new_context)>;

    explicit UiElement(std::string name = "UiElement");
    ~UiElement() override;

    /// Effective context: the local one if set, else the inherited one
    [[nodiscard]] bindery_model::ObjectPtr context() const;

    /// Replace the local context; listeners run if the effective context changed
    void set_context(bindery_model::ObjectPtr context);

    /// Drop the local context and go back to inheriting
    void clear_context();

    [[nodiscard]] bool has_local_context() const noexcept { return m_has_local_context; }

    ListenerToken add_context_changed(ContextChangedCallback callback);

    bool remove_context_changed(ListenerToken token) noexcept;

    [[nodiscard]] std::size_t context_listener_count() const noexcept { return m_context_listeners.size(); }

protected:
    void on_inherited_context_changed(const bindery_model::ObjectPtr& old_context,
                                      const bindery_model::ObjectPtr& new_context) override;

private:
    void raise_context_changed(const bindery_model::ObjectPtr& old_context,
                               const bindery_model::ObjectPtr& new_context);

    bindery_model::ObjectPtr m_local_context;
    bool m_has_local_context{false};
    std::map<ListenerToken, ContextChangedCallback> m_context_listeners;
    ListenerToken m_next_context_token{1};
};

/// Create a UI object of type T
template<typename T, typename... Args>
[[nodiscard]] std::shared_ptr<T> make_ui(Args&&... args) {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace bindery_ui
