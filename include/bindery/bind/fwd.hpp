#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for bindery_bind

#include <cstdint>
#include <memory>

namespace bindery_bind {

enum class BindingMode : std::uint8_t;
enum class DirectiveState : std::uint8_t;

class PropertyPath;
struct TargetSlot;
class SubscriptionDirector;
struct ProvideValueTarget;
struct DirectiveOptions;
class BindingDirective;
struct BinderySettings;

using BindingDirectivePtr = std::shared_ptr<BindingDirective>;

} // namespace bindery_bind
