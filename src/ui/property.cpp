/// @file property.cpp
/// @brief Property descriptor implementation for bindery_ui

#include <bindery/ui/property.hpp>
#include <bindery/ui/object.hpp>

#include <atomic>

namespace bindery_ui {

namespace {

std::uint64_t next_property_id() {
    static std::atomic<std::uint64_t> s_next{1};
    return s_next.fetch_add(1, std::memory_order_relaxed);
}

} // anonymous namespace

PropertyDescriptor::PropertyDescriptor(std::string name, bindery_core::ValueKind kind,
                                       std::string owner_name, TypeCheck owner_check,
                                       PropertyMetadata metadata)
    : m_id(next_property_id())
    , m_name(std::move(name))
    , m_kind(kind)
    , m_owner_name(std::move(owner_name))
    , m_owner_check(std::move(owner_check))
    , m_metadata(std::move(metadata)) {}

bool PropertyDescriptor::is_owner_instance(const UiObject& obj) const {
    return !m_owner_check || m_owner_check(obj);
}

bool PropertyDescriptor::accepts(const bindery_core::Value& value) const {
    return bindery_core::kind_of(value) == m_kind;
}

PropertyMetadata PropertyDescriptor::metadata_for(const UiObject& obj) const {
    std::lock_guard lock(m_mutex);
    for (auto it = m_overrides.rbegin(); it != m_overrides.rend(); ++it) {
        if (it->check(obj)) {
            return it->metadata;
        }
    }
    return m_metadata;
}

void PropertyDescriptor::add_override(TypeCheck check, PropertyMetadata metadata) {
    std::lock_guard lock(m_mutex);
    m_overrides.push_back(Override{std::move(check), std::move(metadata)});
}

} // namespace bindery_ui
