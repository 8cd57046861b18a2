#include "stdinc.hpp"

#include "haul/utils/string-utils.hpp"

#include <catch2/catch_all.hpp>

namespace haul::tests {

CATCH_TEST_CASE("StrUtils", "[str-utils]") {
  CATCH_SECTION("explode") {
    CATCH_REQUIRE(explode("", ':').size() == 1);

    const auto parts = explode("alice:secret::10", ':');
    CATCH_REQUIRE(parts.size() == 4);
    CATCH_REQUIRE(parts[0] == "alice");
    CATCH_REQUIRE(parts[1] == "secret");
    CATCH_REQUIRE(parts[2] == "");
    CATCH_REQUIRE(parts[3] == "10");
  }

  CATCH_SECTION("trim") {
    CATCH_REQUIRE(trim_copy("  job.added \t\n") == "job.added");
    CATCH_REQUIRE(trim_copy("   ") == "");
    CATCH_REQUIRE(trim_view("x") == "x");
    CATCH_REQUIRE(trim_view(" a b ") == "a b");
  }

  CATCH_SECTION("hex-dump") {
    const std::string_view text = "haul";
    const auto dump = str(std::as_bytes(std::span{text.data(), text.size()}));
    CATCH_REQUIRE(dump.size() == 68);
    CATCH_REQUIRE(dump.starts_with("00000000: 6861 756c"));
    CATCH_REQUIRE(dump.substr(51, 4) == "haul");
    CATCH_REQUIRE(dump.back() == '\n');
  }

  CATCH_SECTION("to-lower") { CATCH_REQUIRE(to_lower_copy("Read-Only") == "read-only"); }
}
} // namespace haul::tests
