/// @file test_object.cpp
/// @brief Tests for context objects and endpoints

#include <catch2/catch.hpp>
#include <bindery/model/endpoint.hpp>
#include <bindery/model/object.hpp>

#include <vector>

using namespace bindery_model;
using bindery_core::Value;
using bindery_core::ValueKind;

TEST_CASE("DynamicObject: members", "[model][object]") {
    auto vm = make_object("PlayerViewModel");
    auto stats = make_object("Stats");

    REQUIRE(vm->type_name() == "PlayerViewModel");
    REQUIRE(vm->get_member("Stats") == nullptr);

    vm->set_member("Stats", stats);
    REQUIRE(vm->get_member("Stats") == stats);
    REQUIRE(vm->has_member("Stats"));

    SECTION("empty member is present but yields null") {
        vm->set_member("Empty", nullptr);
        REQUIRE(vm->has_member("Empty"));
        REQUIRE(vm->get_member("Empty") == nullptr);
    }

    SECTION("remove") {
        REQUIRE(vm->remove_member("Stats"));
        REQUIRE_FALSE(vm->remove_member("Stats"));
        REQUIRE(vm->get_member("Stats") == nullptr);
    }

    SECTION("names are sorted") {
        vm->set_member("Alpha", stats);
        REQUIRE(vm->member_names() == std::vector<std::string>{"Alpha", "Stats"});
    }

    SECTION("plain objects expose no capabilities") {
        REQUIRE(vm->observable_capabilities().empty());
        REQUIRE(vm->observer_capabilities().empty());
    }
}

TEST_CASE("ObservableProperty: capabilities", "[model][endpoint]") {
    auto score = make_property<std::int32_t>(3);

    auto observables = score->observable_capabilities();
    auto observers = score->observer_capabilities();
    REQUIRE(observables.size() == 1);
    REQUIRE(observers.size() == 1);
    REQUIRE(observables.front()->element_kind() == ValueKind::I32);
    REQUIRE(observers.front()->accepted_kind() == ValueKind::I32);

    SECTION("value stream replays and tags values") {
        std::vector<Value> seen;
        auto sub = observables.front()->value_stream()->subscribe([&seen](const Value& v) { seen.push_back(v); });

        score->set(4);
        REQUIRE(seen.size() == 2);
        REQUIRE(std::get<std::int32_t>(seen[0]) == 3);
        REQUIRE(std::get<std::int32_t>(seen[1]) == 4);
    }

    SECTION("value observer writes matching kinds only") {
        auto sink = observers.front()->value_observer();
        sink->on_next(Value{std::int32_t{9}});
        REQUIRE(score->value() == 9);

        sink->on_next(Value{std::string("nine")});
        REQUIRE(score->value() == 9);
    }
}

TEST_CASE("Endpoint: read-only stream", "[model][endpoint]") {
    auto subject = std::make_shared<bindery_rx::Subject<std::string>>();
    auto endpoint = make_endpoint<std::string>(subject);

    REQUIRE(endpoint->observable_capabilities().size() == 1);
    REQUIRE(endpoint->observer_capabilities().empty());
    REQUIRE(endpoint->element_kind() == ValueKind::String);
}
