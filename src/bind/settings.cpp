/// @file settings.cpp
/// @brief JSON settings loading for bindery

#include <bindery/bind/settings.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>

namespace bindery_bind {

using bindery_core::Err;
using bindery_core::Error;
using bindery_core::ErrorCode;

namespace {

std::mutex g_defaults_mutex;
std::optional<BindingMode> g_default_mode;
std::atomic<bool> g_trace_writes{false};

bindery_core::Result<void> parse_logging(const nlohmann::json& j, bindery_core::LogConfig& config) {
    if (!j.is_object()) {
        return Err(Error(ErrorCode::ParseError, "'logging' must be an object"));
    }

    if (j.contains("level")) {
        auto text = j["level"].get<std::string>();
        auto level = bindery_core::parse_log_level(text);
        if (!level) {
            return Err(Error(ErrorCode::ParseError, "Unknown log level: '" + text + "'"));
        }
        config.level = *level;
    }

    config.console_enabled = j.value("console", config.console_enabled);
    config.file_enabled = j.value("file", config.file_enabled);
    config.log_directory = j.value("directory", config.log_directory);
    config.max_file_size = j.value("max_file_size", config.max_file_size);
    config.max_files = j.value("max_files", config.max_files);
    return bindery_core::Ok();
}

bindery_core::Result<void> parse_binding(const nlohmann::json& j, BinderySettings& settings) {
    if (!j.is_object()) {
        return Err(Error(ErrorCode::ParseError, "'binding' must be an object"));
    }

    if (j.contains("default_mode")) {
        auto text = j["default_mode"].get<std::string>();
        auto mode = parse_binding_mode(text);
        if (!mode) {
            return Err(Error(ErrorCode::ParseError, "Unknown binding mode: '" + text + "'"));
        }
        // "Default" leaves the metadata rule in charge
        if (*mode == BindingMode::Default) {
            settings.default_mode.reset();
        } else {
            settings.default_mode = *mode;
        }
    }

    settings.trace_writes = j.value("trace_writes", settings.trace_writes);
    return bindery_core::Ok();
}

} // anonymous namespace

bindery_core::Result<BinderySettings> parse_settings(const std::string& json_text) {
    BinderySettings settings;

    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return Err<BinderySettings>(Error(ErrorCode::ParseError, "Settings root must be an object"));
        }

        if (j.contains("logging")) {
            auto result = parse_logging(j["logging"], settings.logging);
            if (!result) return Err<BinderySettings>(result.error());
        }

        if (j.contains("binding")) {
            auto result = parse_binding(j["binding"], settings);
            if (!result) return Err<BinderySettings>(result.error());
        }
    } catch (const nlohmann::json::exception& e) {
        return Err<BinderySettings>(Error(ErrorCode::ParseError, std::string("Invalid settings: ") + e.what()));
    }

    return bindery_core::Ok(std::move(settings));
}

bindery_core::Result<BinderySettings> load_settings(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<BinderySettings>(Error(ErrorCode::IOError, "Cannot open settings file: " + path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_settings(buffer.str());
    if (!result) {
        return Err<BinderySettings>(result.error().with_context("file", path));
    }
    return result;
}

void apply_settings(const BinderySettings& settings) {
    bindery_core::configure_logging(settings.logging);
    set_default_mode_override(settings.default_mode);
    set_trace_writes(settings.trace_writes);

    bindery_core::bind_logger()->debug("Settings applied (default mode: {}, trace writes: {})",
        settings.default_mode ? binding_mode_name(*settings.default_mode) : "metadata",
        settings.trace_writes);
}

std::optional<BindingMode> default_mode_override() {
    std::lock_guard lock(g_defaults_mutex);
    return g_default_mode;
}

void set_default_mode_override(std::optional<BindingMode> mode) {
    std::lock_guard lock(g_defaults_mutex);
    g_default_mode = mode;
}

bool trace_writes_enabled() noexcept {
    return g_trace_writes.load(std::memory_order_relaxed);
}

void set_trace_writes(bool enabled) noexcept {
    g_trace_writes.store(enabled, std::memory_order_relaxed);
}

} // namespace bindery_bind
