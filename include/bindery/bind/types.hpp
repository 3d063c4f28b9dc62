#pragma once

/// @file types.hpp
/// @brief Binding modes and directive states for bindery_bind

#include "fwd.hpp"

#include <optional>
#include <string_view>

namespace bindery_bind {

// =============================================================================
// BindingMode
// =============================================================================

/// Direction of data flow between endpoint and target slot
enum class BindingMode : std::uint8_t {
    Default,         ///< Resolved from property metadata on first setup
    OneTime,         ///< Endpoint to target, first value only
    OneWay,          ///< Endpoint to target
    OneWayToSource,  ///< Target to endpoint
    TwoWay,          ///< Both directions
};

/// Get binding mode name
[[nodiscard]] inline const char* binding_mode_name(BindingMode mode) {
    switch (mode) {
        case BindingMode::Default: return "Default";
        case BindingMode::OneTime: return "OneTime";
        case BindingMode::OneWay: return "OneWay";
        case BindingMode::OneWayToSource: return "OneWayToSource";
        case BindingMode::TwoWay: return "TwoWay";
        default: return "Unknown";
    }
}

/// Parse a binding mode name (as produced by binding_mode_name)
[[nodiscard]] std::optional<BindingMode> parse_binding_mode(std::string_view text);

/// True if the mode writes endpoint values into the target
[[nodiscard]] constexpr bool listens(BindingMode mode) noexcept {
    return mode == BindingMode::OneTime || mode == BindingMode::OneWay || mode == BindingMode::TwoWay;
}

/// True if the mode forwards target changes to the endpoint
[[nodiscard]] constexpr bool emits(BindingMode mode) noexcept {
    return mode == BindingMode::OneWayToSource || mode == BindingMode::TwoWay;
}

// =============================================================================
// DirectiveState
// =============================================================================

/// Lifecycle state of a binding directive
enum class DirectiveState : std::uint8_t {
    Unattached,  ///< Not yet instantiated against a target
    Inert,       ///< Attached, no endpoint (no context or path unresolved)
    Bound,       ///< Attached, subscriptions installed for the endpoint
};

[[nodiscard]] inline const char* directive_state_name(DirectiveState state) {
    switch (state) {
        case DirectiveState::Unattached: return "Unattached";
        case DirectiveState::Inert: return "Inert";
        case DirectiveState::Bound: return "Bound";
        default: return "Unknown";
    }
}

} // namespace bindery_bind
