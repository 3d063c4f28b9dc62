/// @file property_observer.cpp
/// @brief Property change streams for bindery_ui

#include <bindery/ui/property_observer.hpp>
#include <bindery/ui/object.hpp>
#include <bindery/core/log.hpp>

namespace bindery_ui {

bindery_rx::ObservablePtr<bindery_core::Value> observe_property(const UiObjectPtr& target,
                                                                 PropertyPtr property) {
    std::weak_ptr<UiObject> weak_target = target;

    return bindery_rx::make_observable<bindery_core::Value>(
        [weak_target, property](bindery_rx::ObserverPtr<bindery_core::Value> observer) -> bindery_rx::Subscription {
            auto target = weak_target.lock();
            if (!target || !property) {
                return {};
            }

            auto token = target->add_value_changed(*property, [observer, property](const UiObject& sender) {
                observer->on_next(sender.get_value(*property));
            });

            bindery_core::ui_logger()->trace("Observing '{}.{}'", target->name(), property->name());

            return bindery_rx::Subscription([weak_target, property, token]() {
                if (auto alive = weak_target.lock()) {
                    alive->remove_value_changed(*property, token);
                }
            });
        });
}

} // namespace bindery_ui
