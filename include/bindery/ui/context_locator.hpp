#pragma once

/// @file context_locator.hpp
/// @brief Locating the element that supplies a node's binding context

#include "fwd.hpp"

#include <memory>

namespace bindery_ui {

/// Host capability: find the element whose context a node binds against
class IContextLocator {
public:
    virtual ~IContextLocator() = default;

    /// Nearest context holder for `node`, or null if there is none
    [[nodiscard]] virtual UiElementPtr find_context_source(UiObject& node) const = 0;
};

/// Walks the logical tree upwards from the node itself.
/// Plain UiObjects (transforms, brushes...) carry no context, so the walk
/// continues through their parents until a UiElement is reached.
class LogicalTreeContextLocator : public IContextLocator {
public:
    [[nodiscard]] UiElementPtr find_context_source(UiObject& node) const override;
};

/// Shared default locator
[[nodiscard]] std::shared_ptr<const IContextLocator> default_context_locator();

} // namespace bindery_ui
