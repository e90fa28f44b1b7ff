#include <opgraph/types/value.h>

#include <catch2/catch_test_macros.hpp>

namespace opgraph::test {

TEST_CASE("Value kinds", "[value]") {
    REQUIRE(Value{}.kind() == ValueKind::NONE);
    REQUIRE(Value{nullptr}.is_null());
    REQUIRE(Value{true}.kind() == ValueKind::BOOLEAN);
    REQUIRE(Value{5}.kind() == ValueKind::NUMBER);
    REQUIRE(Value{2.5}.kind() == ValueKind::NUMBER);
    REQUIRE(Value{"add"}.kind() == ValueKind::STRING);
    REQUIRE(Value{ValueList{1, 2}}.kind() == ValueKind::LIST);
}

TEST_CASE("Value integers are held as numbers", "[value]") {
    Value v{5};
    REQUIRE(v.is<double>());
    REQUIRE(v.as<double>() == 5.0);
    REQUIRE(v == Value{5.0});
}

TEST_CASE("Value conforms_to", "[value]") {
    REQUIRE(Value{1}.conforms_to(ValueKind::NUMBER));
    REQUIRE(Value{1}.conforms_to(ValueKind::ANY));
    REQUIRE_FALSE(Value{"1"}.conforms_to(ValueKind::NUMBER));
    REQUIRE(Value{}.conforms_to(ValueKind::STRING));
}

TEST_CASE("Value accessors", "[value]") {
    Value v{"text"};
    REQUIRE(v.try_as<double>() == nullptr);
    REQUIRE(*v.try_as<std::string>() == "text");
    REQUIRE_THROWS_AS(v.as<double>(), std::bad_variant_access);
    REQUIRE(v.as_number_or(-1.0) == -1.0);
    REQUIRE(Value{true}.as_number_or(0.0) == 1.0);
}

TEST_CASE("Value to_string", "[value]") {
    REQUIRE(Value{}.to_string() == "null");
    REQUIRE(Value{false}.to_string() == "false");
    REQUIRE(Value{5}.to_string() == "5");
    REQUIRE(Value{"add"}.to_string() == "\"add\"");
    REQUIRE(Value{ValueList{1, "a", ValueList{}}}.to_string() == "[1, \"a\", []]");
    REQUIRE(fmt::format("{}", Value{2.5}) == "2.5");
}

} // namespace opgraph::test
