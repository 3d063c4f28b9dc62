#pragma once

/// @file property.hpp
/// @brief Property descriptors and metadata for bindery_ui
///
/// A PropertyDescriptor names one typed slot that UiObjects can hold. It
/// carries the declared value kind, an owner check and metadata (default
/// value, default binding direction) that owner subtypes may override.

#include "fwd.hpp"
#include <bindery/core/value.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeinfo>
#include <vector>

namespace bindery_ui {

// =============================================================================
// PropertyMetadata
// =============================================================================

/// Per-type property metadata
struct PropertyMetadata {
    bindery_core::Value default_value;
    bool binds_two_way_by_default = false;
};

// =============================================================================
// PropertyDescriptor
// =============================================================================

/// Descriptor of a typed property slot
class PropertyDescriptor {
public:
    using TypeCheck = std::function<bool(const UiObject&)>;

    /// Register a property of type T declared by Owner
    template<typename Owner, typename T>
    [[nodiscard]] static PropertyPtr register_property(std::string name, T default_value,
                                                      bool binds_two_way_by_default = false) {
        PropertyMetadata metadata;
        metadata.default_value = bindery_core::Value{std::in_place_type<T>, std::move(default_value)};
        metadata.binds_two_way_by_default = binds_two_way_by_default;
        return std::make_shared<PropertyDescriptor>(
            std::move(name),
            bindery_core::value_kind_of<T>(),
            typeid(Owner).name(),
            [](const UiObject& obj) { return dynamic_cast<const Owner*>(&obj) != nullptr; },
            std::move(metadata));
    }

    PropertyDescriptor(std::string name, bindery_core::ValueKind kind, std::string owner_name,
                       TypeCheck owner_check, PropertyMetadata metadata);

    PropertyDescriptor(const PropertyDescriptor&) = delete;
    PropertyDescriptor& operator=(const PropertyDescriptor&) = delete;

    /// Process-unique id
    [[nodiscard]] std::uint64_t id() const noexcept { return m_id; }

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    /// Declared value kind
    [[nodiscard]] bindery_core::ValueKind value_kind() const noexcept { return m_kind; }

    /// Owner type name (diagnostics)
    [[nodiscard]] const std::string& owner_name() const noexcept { return m_owner_name; }

    /// True if `obj` is an instance of the declaring type
    [[nodiscard]] bool is_owner_instance(const UiObject& obj) const;

    /// True if `value` may be stored in this property
    [[nodiscard]] bool accepts(const bindery_core::Value& value) const;

    /// Metadata given at registration
    [[nodiscard]] const PropertyMetadata& default_metadata() const noexcept { return m_metadata; }

    /// Metadata in effect for `obj` (most recent matching override wins)
    [[nodiscard]] PropertyMetadata metadata_for(const UiObject& obj) const;

    /// Override metadata for objects of type Derived
    template<typename Derived>
    void override_metadata(PropertyMetadata metadata) {
        add_override([](const UiObject& obj) { return dynamic_cast<const Derived*>(&obj) != nullptr; },
                     std::move(metadata));
    }

    /// Override metadata for objects matching `check`
    void add_override(TypeCheck check, PropertyMetadata metadata);

private:
    struct Override {
        TypeCheck check;
        PropertyMetadata metadata;
    };

    std::uint64_t m_id;
    std::string m_name;
    bindery_core::ValueKind m_kind;
    std::string m_owner_name;
    TypeCheck m_owner_check;
    PropertyMetadata m_metadata;

    mutable std::mutex m_mutex;
    std::vector<Override> m_overrides;
};

} // namespace bindery_ui
