/// @file subscription.cpp
/// @brief Subscription disposal for bindery_rx

#include <bindery/rx/subscription.hpp>
#include <bindery/core/log.hpp>

#include <exception>

namespace bindery_rx {

void Subscription::dispose() noexcept {
    if (!m_on_dispose) return;

    auto action = std::move(m_on_dispose);
    m_on_dispose = nullptr;

    try {
        action();
    } catch (const std::exception& e) {
        bindery_core::core_logger()->error("Subscription release failed: {}", e.what());
    } catch (...) {
        bindery_core::core_logger()->error("Subscription release failed: unknown exception");
    }
}

} // namespace bindery_rx
