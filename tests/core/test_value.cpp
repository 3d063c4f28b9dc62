/// @file test_value.cpp
/// @brief Tests for bindery_core value kinds

#include <catch2/catch.hpp>
#include <bindery/core/value.hpp>

#include <cstdint>
#include <string>

using namespace bindery_core;

TEST_CASE("Value: kind mapping", "[core][value]") {
    STATIC_REQUIRE(value_kind_of<bool>() == ValueKind::Bool);
    STATIC_REQUIRE(value_kind_of<std::int32_t>() == ValueKind::I32);
    STATIC_REQUIRE(value_kind_of<std::int64_t>() == ValueKind::I64);
    STATIC_REQUIRE(value_kind_of<float>() == ValueKind::F32);
    STATIC_REQUIRE(value_kind_of<double>() == ValueKind::F64);
    STATIC_REQUIRE(value_kind_of<const std::string&>() == ValueKind::String);

    STATIC_REQUIRE(is_bindable_v<double>);
    STATIC_REQUIRE_FALSE(is_bindable_v<char*>);
}

TEST_CASE("Value: kind_of follows the held alternative", "[core][value]") {
    REQUIRE(kind_of(Value{}) == ValueKind::Empty);
    REQUIRE(is_empty(Value{}));
    REQUIRE(kind_of(Value{true}) == ValueKind::Bool);
    REQUIRE(kind_of(Value{std::int32_t{3}}) == ValueKind::I32);
    REQUIRE(kind_of(Value{std::int64_t{3}}) == ValueKind::I64);
    REQUIRE(kind_of(Value{1.5f}) == ValueKind::F32);
    REQUIRE(kind_of(Value{1.5}) == ValueKind::F64);
    REQUIRE(kind_of(Value{std::string("x")}) == ValueKind::String);
}

TEST_CASE("Value: textual form", "[core][value]") {
    SECTION("booleans") {
        REQUIRE(to_text(Value{true}) == "true");
        REQUIRE(to_text(Value{false}) == "false");
    }

    SECTION("integers") {
        REQUIRE(to_text(Value{std::int32_t{42}}) == "42");
        REQUIRE(to_text(Value{std::int32_t{-7}}) == "-7");
        REQUIRE(to_text(Value{std::int64_t{9000000000}}) == "9000000000");
    }

    SECTION("floating point uses the shortest form") {
        REQUIRE(to_text(Value{0.5}) == "0.5");
        REQUIRE(to_text(Value{0.1f}) == "0.1");
        REQUIRE(to_text(Value{2.0}) == "2");
    }

    SECTION("strings and empty") {
        REQUIRE(to_text(Value{std::string("hello")}) == "hello");
        REQUIRE(to_text(Value{}).empty());
    }
}

TEST_CASE("Value: describe", "[core][value]") {
    REQUIRE(describe(Value{std::int32_t{42}}) == "i32(42)");
    REQUIRE(describe(Value{std::string("hi")}) == "string(\"hi\")");
    REQUIRE(describe(Value{}) == "empty");
    REQUIRE(std::string(value_kind_name(ValueKind::F64)) == "f64");
}
