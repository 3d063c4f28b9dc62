/// @file context_locator.cpp
/// @brief Logical tree context locator for bindery_ui

#include <bindery/ui/context_locator.hpp>
#include <bindery/ui/object.hpp>

namespace bindery_ui {

UiElementPtr LogicalTreeContextLocator::find_context_source(UiObject& node) const {
    UiObjectPtr current = node.shared_from_this();
    while (current) {
        if (auto element = std::dynamic_pointer_cast<UiElement>(current)) {
            return element;
        }
        current = current->logical_parent();
    }
    return nullptr;
}

std::shared_ptr<const IContextLocator> default_context_locator() {
    static const auto s_locator = std::make_shared<const LogicalTreeContextLocator>();
    return s_locator;
}

} // namespace bindery_ui
