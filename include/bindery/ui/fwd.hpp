#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for bindery_ui

#include <cstdint>
#include <memory>

namespace bindery_ui {

struct PropertyMetadata;
class PropertyDescriptor;
class UiObject;
class UiElement;
class IContextLocator;
class LogicalTreeContextLocator;

using PropertyPtr = std::shared_ptr<PropertyDescriptor>;
using UiObjectPtr = std::shared_ptr<UiObject>;
using UiElementPtr = std::shared_ptr<UiElement>;

/// Token identifying a registered change listener
using ListenerToken = std::uint64_t;

} // namespace bindery_ui
