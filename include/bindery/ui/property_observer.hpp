#pragma once

/// @file property_observer.hpp
/// @brief Streams of property changes on UI objects
///
/// Each subscription registers one value-changed listener on the target and
/// emits the property's current value after every change. The stream never
/// completes. The target is held weakly: disposing after the target is gone
/// is a no-op.

#include "fwd.hpp"
#include <bindery/core/value.hpp>
#include <bindery/rx/observable.hpp>
#include <bindery/rx/operators.hpp>

namespace bindery_ui {

/// Observe `property` on `target` as tagged values
[[nodiscard]] bindery_rx::ObservablePtr<bindery_core::Value> observe_property(
    const UiObjectPtr& target, PropertyPtr property);

/// Observe `property` on `target` as T; values of another kind are skipped
template<typename T>
[[nodiscard]] bindery_rx::ObservablePtr<T> observe(const UiObjectPtr& target, PropertyPtr property) {
    auto values = observe_property(target, std::move(property));
    return bindery_rx::make_observable<T>([values](bindery_rx::ObserverPtr<T> downstream) {
        return values->subscribe(bindery_rx::make_observer<bindery_core::Value>(
            [downstream](const bindery_core::Value& value) {
                if (const auto* typed = std::get_if<T>(&value)) {
                    downstream->on_next(*typed);
                }
            }));
    });
}

} // namespace bindery_ui
