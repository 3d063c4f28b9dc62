#pragma once

/// @file settings.hpp
/// @brief Runtime settings for bindery (JSON-backed)
///
/// Shape of a settings document (every key optional):
///
///     {
///       "logging": { "level": "debug", "console": true, "file": false,
///                    "directory": "logs", "max_file_size": 1048576, "max_files": 3 },
///       "binding": { "default_mode": "TwoWay", "trace_writes": false }
///     }

#include "fwd.hpp"
#include "types.hpp"
#include <bindery/core/error.hpp>
#include <bindery/core/log.hpp>

#include <optional>
#include <string>

namespace bindery_bind {

struct BinderySettings {
    bindery_core::LogConfig logging;

    /// Mode used by directives created with BindingMode::Default.
    /// Empty keeps the per-property metadata rule.
    std::optional<BindingMode> default_mode;

    /// Log every slot write at trace level
    bool trace_writes = false;
};

/// Parse a settings document
[[nodiscard]] bindery_core::Result<BinderySettings> parse_settings(const std::string& json_text);

/// Read and parse a settings file
[[nodiscard]] bindery_core::Result<BinderySettings> load_settings(const std::string& path);

/// Configure logging and the process-wide binding defaults
void apply_settings(const BinderySettings& settings);

// =============================================================================
// Process-wide defaults
// =============================================================================

[[nodiscard]] std::optional<BindingMode> default_mode_override();
void set_default_mode_override(std::optional<BindingMode> mode);

[[nodiscard]] bool trace_writes_enabled() noexcept;
void set_trace_writes(bool enabled) noexcept;

} // namespace bindery_bind
