#pragma once

/// @file path.hpp
/// @brief Dot-separated member paths and their resolution

#include "fwd.hpp"
#include <bindery/core/error.hpp>
#include <bindery/model/fwd.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace bindery_bind {

// =============================================================================
// PropertyPath
// =============================================================================

/// Immutable ordered sequence of member names, e.g. "Player.Stats.Health"
class PropertyPath {
public:
    /// Parse dot-separated text. Empty text or an empty segment is an error.
    [[nodiscard]] static bindery_core::Result<PropertyPath> parse(std::string_view text);

    [[nodiscard]] const std::vector<std::string>& segments() const noexcept { return m_segments; }

    [[nodiscard]] std::size_t size() const noexcept { return m_segments.size(); }

    /// Original text form
    [[nodiscard]] const std::string& text() const noexcept { return m_text; }

    bool operator==(const PropertyPath& other) const { return m_segments == other.m_segments; }

private:
    PropertyPath(std::string text, std::vector<std::string> segments)
        : m_text(std::move(text)), m_segments(std::move(segments)) {}

    std::string m_text;
    std::vector<std::string> m_segments;
};

// =============================================================================
// Resolution
// =============================================================================

/// Walk `path` from `root`; null if root or any step is absent.
/// Pure: no caching, no side effects.
[[nodiscard]] bindery_model::ObjectPtr resolve_path(const bindery_model::ObjectPtr& root,
                                                    const PropertyPath& path);

} // namespace bindery_bind
