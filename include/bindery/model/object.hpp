#pragma once

/// @file object.hpp
/// @brief Source objects that binding paths are resolved against
///
/// A context object exposes named members. Path resolution asks each object
/// for one member by name; the object decides how to answer, so no runtime
/// type inspection is involved. Objects reached at the end of a path are
/// endpoints when they expose observable and/or observer capabilities.

#include "fwd.hpp"
#include <bindery/core/value.hpp>
#include <bindery/rx/fwd.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace bindery_model {

// =============================================================================
// Capabilities
// =============================================================================

/// Endpoint side that produces values (endpoint -> target)
class ObservableCapability {
public:
    virtual ~ObservableCapability() = default;

    /// Kind of every element the stream carries
    [[nodiscard]] virtual bindery_core::ValueKind element_kind() const = 0;

    /// Stream of elements as tagged values
    [[nodiscard]] virtual bindery_rx::ObservablePtr<bindery_core::Value> value_stream() = 0;
};

/// Endpoint side that accepts values (target -> endpoint)
class ObserverCapability {
public:
    virtual ~ObserverCapability() = default;

    /// Kind of element the observer accepts
    [[nodiscard]] virtual bindery_core::ValueKind accepted_kind() const = 0;

    /// Observer receiving tagged values; values of other kinds are ignored
    [[nodiscard]] virtual bindery_rx::ObserverPtr<bindery_core::Value> value_observer() = 0;
};

// =============================================================================
// Object
// =============================================================================

/// Base of everything that can be a context object, a path step or an endpoint
class Object {
public:
    virtual ~Object() = default;

    /// Member with the given name, or null if absent or empty
    [[nodiscard]] virtual ObjectPtr get_member(std::string_view name) const;

    /// Observable capabilities exposed by this object
    [[nodiscard]] virtual std::vector<ObservableCapability*> observable_capabilities();

    /// Observer capabilities exposed by this object
    [[nodiscard]] virtual std::vector<ObserverCapability*> observer_capabilities();

    /// Name used in diagnostics
    [[nodiscard]] virtual std::string type_name() const { return "Object"; }
};

// =============================================================================
// DynamicObject
// =============================================================================

/// Object with a runtime member table, the usual shape of a view model
class DynamicObject : public Object {
public:
    DynamicObject() = default;
    explicit DynamicObject(std::string type_name) : m_type_name(std::move(type_name)) {}

    /// Set or replace a member (null stores an empty member)
    void set_member(const std::string& name, ObjectPtr value);

    /// Remove a member entirely
    bool remove_member(const std::string& name);

    /// Check if a member entry exists (even if empty)
    [[nodiscard]] bool has_member(const std::string& name) const;

    /// Member names in sorted order
    [[nodiscard]] std::vector<std::string> member_names() const;

    [[nodiscard]] ObjectPtr get_member(std::string_view name) const override;

    [[nodiscard]] std::string type_name() const override { return m_type_name; }

private:
    std::string m_type_name{"DynamicObject"};
    mutable std::mutex m_mutex;
    std::map<std::string, ObjectPtr, std::less<>> m_members;
};

/// Create an empty dynamic object
[[nodiscard]] std::shared_ptr<DynamicObject> make_object(std::string type_name = "DynamicObject");

} // namespace bindery_model
