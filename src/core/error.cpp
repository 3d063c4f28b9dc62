/// @file error.cpp
/// @brief Error handling implementation for bindery_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics for diagnostics

#include <bindery/core/error.hpp>
#include <bindery/core/value.hpp>
#include <array>
#include <atomic>
#include <sstream>

namespace bindery_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* bind_error_kind_name(BindError::Kind kind) {
    switch (kind) {
        case BindError::Kind::InvalidPath: return "InvalidPath";
        case BindError::Kind::NoContextSource: return "NoContextSource";
        case BindError::Kind::ObservableCapability: return "ObservableCapability";
        case BindError::Kind::TypeMismatch: return "TypeMismatch";
        case BindError::Kind::NoExecutionContext: return "NoExecutionContext";
        case BindError::Kind::InvalidTarget: return "InvalidTarget";
        default: return "Unknown";
    }
}

/// Format binding error with full context
std::string format_bind_error(const BindError& err) {
    std::ostringstream oss;
    oss << "[BindError:" << bind_error_kind_name(err.kind) << "] " << err.message;

    if (!err.subject.empty()) {
        oss << " (subject: " << err.subject << ")";
    }
    if (!err.expected.empty() && !err.found.empty()) {
        oss << " (expected: " << err.expected << ", found: " << err.found << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, BindError>) {
            oss << detail::format_bind_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<Value, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

namespace {

constexpr std::size_t k_error_code_count = static_cast<std::size_t>(ErrorCode::NotSupported) + 1;

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::array<std::atomic<std::uint64_t>, k_error_code_count> by_code{};
};

ErrorStats& stats() {
    static ErrorStats s_stats;
    return s_stats;
}

} // anonymous namespace

void record_error(const Error& error) {
    auto& s = stats();
    s.total_errors.fetch_add(1, std::memory_order_relaxed);

    auto index = static_cast<std::size_t>(error.code());
    if (index < k_error_code_count) {
        s.by_code[index].fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return stats().total_errors.load(std::memory_order_relaxed);
}

std::uint64_t error_count(ErrorCode code) {
    auto index = static_cast<std::size_t>(code);
    if (index >= k_error_code_count) return 0;
    return stats().by_code[index].load(std::memory_order_relaxed);
}

void reset_error_stats() {
    auto& s = stats();
    s.total_errors.store(0, std::memory_order_relaxed);
    for (auto& counter : s.by_code) {
        counter.store(0, std::memory_order_relaxed);
    }
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << total_error_count() << "\n";
    for (std::size_t i = 0; i < k_error_code_count; ++i) {
        auto count = stats().by_code[i].load(std::memory_order_relaxed);
        if (count > 0) {
            oss << "  " << error_code_name(static_cast<ErrorCode>(i)) << ": " << count << "\n";
        }
    }
    return oss.str();
}

} // namespace debug

} // namespace bindery_core
