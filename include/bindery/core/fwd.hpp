#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for bindery_core

#include <cstdint>

namespace bindery_core {

// Error handling
enum class ErrorCode : std::uint8_t;
struct BindError;
class Error;

template<typename T, typename E = Error>
class Result;

// Values
enum class ValueKind : std::uint8_t;

// Logging
struct LogConfig;
class LogScope;

} // namespace bindery_core
