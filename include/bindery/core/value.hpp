#pragma once

/// @file value.hpp
/// @brief Tagged value kinds carried by bindable streams and properties
///
/// Binding never inspects C++ types at runtime. Every element that crosses
/// a binding is one of a closed set of kinds, and the kind of a C++ type is
/// fixed at compile time through value_kind_of<T>().

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

namespace bindery_core {

// =============================================================================
// ValueKind
// =============================================================================

/// Element categories supported by bindings
enum class ValueKind : std::uint8_t {
    Empty,
    Bool,
    I32,
    I64,
    F32,
    F64,
    String,
};

/// Get value kind name
[[nodiscard]] inline const char* value_kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Empty: return "empty";
        case ValueKind::Bool: return "bool";
        case ValueKind::I32: return "i32";
        case ValueKind::I64: return "i64";
        case ValueKind::F32: return "f32";
        case ValueKind::F64: return "f64";
        case ValueKind::String: return "string";
        default: return "unknown";
    }
}

// =============================================================================
// Value
// =============================================================================

/// Type-tagged value; alternative order matches ValueKind
using Value = std::variant<
    std::monostate,
    bool,
    std::int32_t,
    std::int64_t,
    float,
    double,
    std::string
>;

/// Get the kind held by a value
[[nodiscard]] inline ValueKind kind_of(const Value& value) noexcept {
    return static_cast<ValueKind>(value.index());
}

/// Check if a value holds nothing
[[nodiscard]] inline bool is_empty(const Value& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

/// Map a C++ type to its value kind
template<typename T>
[[nodiscard]] constexpr ValueKind value_kind_of() {
    using U = std::remove_cv_t<std::remove_reference_t<T>>;
    if constexpr (std::is_same_v<U, bool>) {
        return ValueKind::Bool;
    } else if constexpr (std::is_same_v<U, std::int32_t>) {
        return ValueKind::I32;
    } else if constexpr (std::is_same_v<U, std::int64_t>) {
        return ValueKind::I64;
    } else if constexpr (std::is_same_v<U, float>) {
        return ValueKind::F32;
    } else if constexpr (std::is_same_v<U, double>) {
        return ValueKind::F64;
    } else if constexpr (std::is_same_v<U, std::string>) {
        return ValueKind::String;
    } else {
        static_assert(!sizeof(U*), "type is not a bindable value kind");
    }
}

/// True if T can travel through a binding
template<typename T>
inline constexpr bool is_bindable_v =
    std::is_same_v<T, bool> || std::is_same_v<T, std::int32_t> ||
    std::is_same_v<T, std::int64_t> || std::is_same_v<T, float> ||
    std::is_same_v<T, double> || std::is_same_v<T, std::string>;

/// Textual representation of a value
/// Booleans become "true"/"false", numbers use the shortest round-trip form,
/// strings are returned unchanged and Empty becomes "".
[[nodiscard]] std::string to_text(const Value& value);

/// Human readable description for logs, e.g. "i32(42)"
[[nodiscard]] std::string describe(const Value& value);

} // namespace bindery_core
