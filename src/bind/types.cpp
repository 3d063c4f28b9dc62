/// @file types.cpp
/// @brief Binding mode parsing for bindery_bind

#include <bindery/bind/types.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace bindery_bind {

std::optional<BindingMode> parse_binding_mode(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "default") return BindingMode::Default;
    if (lower == "onetime") return BindingMode::OneTime;
    if (lower == "oneway") return BindingMode::OneWay;
    if (lower == "onewaytosource") return BindingMode::OneWayToSource;
    if (lower == "twoway") return BindingMode::TwoWay;
    return std::nullopt;
}

} // namespace bindery_bind
