/// @file value.cpp
/// @brief Value formatting for bindery_core

#include <bindery/core/value.hpp>

#include <spdlog/fmt/fmt.h>

namespace bindery_core {

std::string to_text(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return {};
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return fmt::format("{}", v);
        }
    }, value);
}

std::string describe(const Value& value) {
    if (is_empty(value)) {
        return "empty";
    }
    if (kind_of(value) == ValueKind::String) {
        return fmt::format("string(\"{}\")", std::get<std::string>(value));
    }
    return fmt::format("{}({})", value_kind_name(kind_of(value)), to_text(value));
}

} // namespace bindery_core
