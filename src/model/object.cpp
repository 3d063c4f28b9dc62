/// @file object.cpp
/// @brief Source object implementation for bindery_model

#include <bindery/model/object.hpp>

namespace bindery_model {

// =============================================================================
// Object
// =============================================================================

ObjectPtr Object::get_member(std::string_view /*name*/) const {
    return nullptr;
}

std::vector<ObservableCapability*> Object::observable_capabilities() {
    return {};
}

std::vector<ObserverCapability*> Object::observer_capabilities() {
    return {};
}

// =============================================================================
// DynamicObject
// =============================================================================

void DynamicObject::set_member(const std::string& name, ObjectPtr value) {
    std::lock_guard lock(m_mutex);
    m_members[name] = std::move(value);
}

bool DynamicObject::remove_member(const std::string& name) {
    std::lock_guard lock(m_mutex);
    return m_members.erase(name) > 0;
}

bool DynamicObject::has_member(const std::string& name) const {
    std::lock_guard lock(m_mutex);
    return m_members.find(name) != m_members.end();
}

std::vector<std::string> DynamicObject::member_names() const {
    std::lock_guard lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_members.size());
    for (const auto& [name, _] : m_members) {
        names.push_back(name);
    }
    return names;
}

ObjectPtr DynamicObject::get_member(std::string_view name) const {
    std::lock_guard lock(m_mutex);
    auto it = m_members.find(name);
    return it != m_members.end() ? it->second : nullptr;
}

std::shared_ptr<DynamicObject> make_object(std::string type_name) {
    return std::make_shared<DynamicObject>(std::move(type_name));
}

} // namespace bindery_model
