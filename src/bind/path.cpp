/// @file path.cpp
/// @brief Property path parsing and resolution for bindery_bind

#include <bindery/bind/path.hpp>
#include <bindery/model/object.hpp>

namespace bindery_bind {

bindery_core::Result<PropertyPath> PropertyPath::parse(std::string_view text) {
    if (text.empty()) {
        return bindery_core::Err<PropertyPath>(
            bindery_core::Error(bindery_core::BindError::invalid_path(std::string(text))));
    }

    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        auto dot = text.find('.', start);
        auto segment = text.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (segment.empty()) {
            return bindery_core::Err<PropertyPath>(
                bindery_core::Error(bindery_core::BindError::invalid_path(std::string(text))));
        }
        segments.emplace_back(segment);
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }

    return PropertyPath(std::string(text), std::move(segments));
}

bindery_model::ObjectPtr resolve_path(const bindery_model::ObjectPtr& root, const PropertyPath& path) {
    bindery_model::ObjectPtr current = root;
    for (const auto& segment : path.segments()) {
        if (!current) {
            return nullptr;
        }
        current = current->get_member(segment);
    }
    return current;
}

} // namespace bindery_bind
