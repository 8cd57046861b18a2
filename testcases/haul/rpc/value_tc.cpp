#include "stdinc.hpp"

#include "haul/rpc/value.hpp"

#include <catch2/catch_all.hpp>

namespace haul::rpc::tests {

CATCH_TEST_CASE("Value", "[value]") {
  CATCH_SECTION("accessors") {
    CATCH_REQUIRE(Value{}.is_null());
    CATCH_REQUIRE(Value{nullptr}.is_null());
    CATCH_REQUIRE(Value{true}.as_bool());
    CATCH_REQUIRE(Value{42}.as_int() == 42);
    CATCH_REQUIRE(Value{uint16_t(7)}.type() == Value::Type::INT);
    CATCH_REQUIRE(Value{2.5}.as_double() == 2.5);
    CATCH_REQUIRE(Value{3}.as_double() == 3.0);
    CATCH_REQUIRE(Value{"job"}.as_string() == "job");
    CATCH_REQUIRE(Value{std::string_view{"job"}} == Value{std::string{"job"}});
  }

  CATCH_SECTION("type mismatch throws") {
    CATCH_REQUIRE_THROWS_AS(Value{"7"}.as_int(), std::invalid_argument);
    CATCH_REQUIRE_THROWS_AS(Value{7}.as_string(), std::invalid_argument);
    CATCH_REQUIRE_THROWS_AS(Value{}.as_list(), std::invalid_argument);
    CATCH_REQUIRE_THROWS_AS(Value{true}.as_dict(), std::invalid_argument);
  }

  CATCH_SECTION("dictionary lookup") {
    const Value dict = Value::Dict{{"id", 3}, {"state", "Queued"}};
    CATCH_REQUIRE(dict.find("id") != nullptr);
    CATCH_REQUIRE(dict.find("id")->as_int() == 3);
    CATCH_REQUIRE(dict.find("progress") == nullptr);
    CATCH_REQUIRE(Value{1}.find("id") == nullptr);
  }

  CATCH_SECTION("to-string") {
    const Value value = Value::Dict{{"b", Value::List{1, "x\"y", nullptr}}, {"a", false}};
    CATCH_REQUIRE(value.to_string() == R"({"a":false,"b":[1,"x\"y",null]})");
  }
}

} // namespace haul::rpc::tests
