#pragma once

/// @file endpoint.hpp
/// @brief Typed endpoints exposing bindable capabilities
///
/// The element type of an endpoint is fixed where the endpoint is declared.
/// Endpoint<T> turns it into a ValueKind tag once, so binding code only ever
/// deals with tagged values.

#include "object.hpp"
#include <bindery/rx/observable.hpp>
#include <bindery/rx/operators.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace bindery_model {

// =============================================================================
// Endpoint
// =============================================================================

/// Object wrapping a typed stream and/or a typed observer
template<typename T>
class Endpoint : public Object, public ObservableCapability, public ObserverCapability {
    static_assert(bindery_core::is_bindable_v<T>, "Endpoint element type must be a bindable value kind");

public:
    explicit Endpoint(bindery_rx::ObservablePtr<T> source,
                      bindery_rx::ObserverPtr<T> sink = nullptr,
                      std::string type_name = "Endpoint")
        : m_source(std::move(source))
        , m_sink(std::move(sink))
        , m_type_name(std::move(type_name)) {}

    // ObservableCapability
    [[nodiscard]] bindery_core::ValueKind element_kind() const override {
        return bindery_core::value_kind_of<T>();
    }

    [[nodiscard]] bindery_rx::ObservablePtr<bindery_core::Value> value_stream() override {
        return bindery_rx::map(m_source, [](const T& value) {
            return bindery_core::Value{std::in_place_type<T>, value};
        });
    }

    // ObserverCapability
    [[nodiscard]] bindery_core::ValueKind accepted_kind() const override {
        return bindery_core::value_kind_of<T>();
    }

    [[nodiscard]] bindery_rx::ObserverPtr<bindery_core::Value> value_observer() override {
        auto sink = m_sink;
        return bindery_rx::make_observer<bindery_core::Value>(
            [sink](const bindery_core::Value& value) {
                if (const auto* typed = std::get_if<T>(&value)) {
                    sink->on_next(*typed);
                }
            });
    }

    // Object
    [[nodiscard]] std::vector<ObservableCapability*> observable_capabilities() override {
        if (!m_source) return {};
        return {static_cast<ObservableCapability*>(this)};
    }

    [[nodiscard]] std::vector<ObserverCapability*> observer_capabilities() override {
        if (!m_sink) return {};
        return {static_cast<ObserverCapability*>(this)};
    }

    [[nodiscard]] std::string type_name() const override { return m_type_name; }

    /// Typed access
    [[nodiscard]] const bindery_rx::ObservablePtr<T>& source() const { return m_source; }
    [[nodiscard]] const bindery_rx::ObserverPtr<T>& sink() const { return m_sink; }

private:
    bindery_rx::ObservablePtr<T> m_source;
    bindery_rx::ObserverPtr<T> m_sink;
    std::string m_type_name;
};

// =============================================================================
// ObservableProperty
// =============================================================================

/// Read/write endpoint backed by a BehaviorSubject; replays its current value
/// to every new subscriber and accepts writes through its observer side
template<typename T>
class ObservableProperty : public Endpoint<T> {
public:
    explicit ObservableProperty(T initial = T{})
        : ObservableProperty(std::make_shared<bindery_rx::BehaviorSubject<T>>(std::move(initial))) {}

    [[nodiscard]] T value() const { return m_subject->value(); }

    void set(const T& value) { m_subject->on_next(value); }

    [[nodiscard]] const std::shared_ptr<bindery_rx::BehaviorSubject<T>>& subject() const {
        return m_subject;
    }

    /// Number of live subscribers (bindings and others)
    [[nodiscard]] std::size_t observer_count() const { return m_subject->observer_count(); }

private:
    explicit ObservableProperty(std::shared_ptr<bindery_rx::BehaviorSubject<T>> subject)
        : Endpoint<T>(subject, subject, "ObservableProperty")
        , m_subject(std::move(subject)) {}

    std::shared_ptr<bindery_rx::BehaviorSubject<T>> m_subject;
};

// =============================================================================
// Helpers
// =============================================================================

template<typename T>
[[nodiscard]] std::shared_ptr<ObservableProperty<T>> make_property(T initial = T{}) {
    return std::make_shared<ObservableProperty<T>>(std::move(initial));
}

template<typename T>
[[nodiscard]] std::shared_ptr<Endpoint<T>> make_endpoint(bindery_rx::ObservablePtr<T> source,
                                                         bindery_rx::ObserverPtr<T> sink = nullptr) {
    return std::make_shared<Endpoint<T>>(std::move(source), std::move(sink));
}

} // namespace bindery_model
