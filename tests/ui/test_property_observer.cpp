/// @file test_property_observer.cpp
/// @brief Tests for property change streams

#include <catch2/catch.hpp>
#include <bindery/ui/object.hpp>
#include <bindery/ui/property_observer.hpp>

#include <vector>

using namespace bindery_ui;
using bindery_core::Value;

namespace {

class Gauge : public UiObject {
public:
    using UiObject::UiObject;

    static inline const PropertyPtr LevelProperty =
        PropertyDescriptor::register_property<Gauge, double>("Level", 0.0);
};

} // anonymous namespace

TEST_CASE("observe_property: emits current values", "[ui][observer]") {
    auto gauge = make_ui<Gauge>("gauge");
    const auto& level = *Gauge::LevelProperty;

    std::vector<Value> seen;
    auto sub = observe_property(gauge, Gauge::LevelProperty)->subscribe([&seen](const Value& v) { seen.push_back(v); });

    REQUIRE(seen.empty());

    REQUIRE(gauge->set_value(level, Value{0.25}).is_ok());
    REQUIRE(gauge->set_value(level, Value{0.25}).is_ok());
    REQUIRE(gauge->set_value(level, Value{0.5}).is_ok());

    REQUIRE(seen.size() == 2);
    REQUIRE(std::get<double>(seen[0]) == 0.25);
    REQUIRE(std::get<double>(seen[1]) == 0.5);

    SECTION("clear emits the default") {
        gauge->clear_value(level);
        REQUIRE(std::get<double>(seen.back()) == 0.0);
    }
}

TEST_CASE("observe_property: one listener per subscription", "[ui][observer]") {
    auto gauge = make_ui<Gauge>("gauge");
    const auto& level = *Gauge::LevelProperty;
    auto stream = observe_property(gauge, Gauge::LevelProperty);

    auto a = stream->subscribe([](const Value&) {});
    REQUIRE(gauge->value_changed_listener_count(level) == 1);

    auto b = stream->subscribe([](const Value&) {});
    REQUIRE(gauge->value_changed_listener_count(level) == 2);

    a.dispose();
    REQUIRE(gauge->value_changed_listener_count(level) == 1);

    SECTION("disposal is idempotent") {
        a.dispose();
        REQUIRE(gauge->value_changed_listener_count(level) == 1);
    }

    b.dispose();
    REQUIRE(gauge->value_changed_listener_count(level) == 0);
}

TEST_CASE("observe_property: target destroyed first", "[ui][observer]") {
    auto gauge = make_ui<Gauge>("gauge");
    auto stream = observe_property(gauge, Gauge::LevelProperty);
    auto sub = stream->subscribe([](const Value&) {});

    gauge.reset();
    sub.dispose();
    REQUIRE_FALSE(sub.is_active());

    SECTION("subscribing after destruction yields nothing") {
        auto late = stream->subscribe([](const Value&) {});
        REQUIRE_FALSE(late.is_active());
    }
}

TEST_CASE("observe<T>: typed view", "[ui][observer]") {
    auto gauge = make_ui<Gauge>("gauge");
    std::vector<double> seen;

    auto sub = observe<double>(gauge, Gauge::LevelProperty)->subscribe([&seen](const double& v) { seen.push_back(v); });
    REQUIRE(gauge->set_value(*Gauge::LevelProperty, Value{0.75}).is_ok());

    REQUIRE(seen == std::vector<double>{0.75});
}
