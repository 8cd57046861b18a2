#include "stdinc.hpp"

#include "haul/daemon/auth.hpp"

#include <catch2/catch_all.hpp>

#include <filesystem>
#include <fstream>

namespace haul::tests {

CATCH_TEST_CASE("AuthLevel", "[auth]") {
  CATCH_SECTION("parse by name or number") {
    CATCH_REQUIRE(parse_auth_level("admin") == AuthLevel::ADMIN);
    CATCH_REQUIRE(parse_auth_level(" Read-Only ") == AuthLevel::READ_ONLY);
    CATCH_REQUIRE(parse_auth_level("5") == AuthLevel::STANDARD);
    CATCH_REQUIRE(parse_auth_level("0") == AuthLevel::NONE);
    CATCH_REQUIRE(!parse_auth_level("4").has_value());
    CATCH_REQUIRE(!parse_auth_level("root").has_value());
    CATCH_REQUIRE(!parse_auth_level("").has_value());
  }

  CATCH_SECTION("authorization is a total order") {
    CATCH_REQUIRE(is_authorized(AuthLevel::ADMIN, AuthLevel::STANDARD));
    CATCH_REQUIRE(is_authorized(AuthLevel::STANDARD, AuthLevel::STANDARD));
    CATCH_REQUIRE(!is_authorized(AuthLevel::READ_ONLY, AuthLevel::STANDARD));
    CATCH_REQUIRE(is_authorized(AuthLevel::NONE, AuthLevel::NONE));
  }

  CATCH_SECTION("an operation without a level is unreachable") {
    CATCH_REQUIRE(!is_authorized(AuthLevel::ADMIN, std::nullopt));
  }
}

CATCH_TEST_CASE("AuthTable", "[auth]") {
  CATCH_SECTION("parse") {
    auto table = AuthTable::parse(R"(
# comment
alice:secret:admin
bob:pa:ss:1

carol:x:standard
)");
    CATCH_REQUIRE(table.has_value());
    CATCH_REQUIRE(table->size() == 3);
    CATCH_REQUIRE(table->check({"alice", "secret"}) == AuthLevel::ADMIN);
    CATCH_REQUIRE(table->check({"bob", "pa:ss"}) == AuthLevel::READ_ONLY);
    CATCH_REQUIRE(table->check({"carol", "x"}) == AuthLevel::STANDARD);
  }

  CATCH_SECTION("bad credentials") {
    AuthTable table;
    table.add("alice", "secret", AuthLevel::ADMIN);
    CATCH_REQUIRE(!table.check({"alice", "Secret"}).has_value());
    CATCH_REQUIRE(!table.check({"alice", "secret2"}).has_value());
    CATCH_REQUIRE(!table.check({"alice", ""}).has_value());
    CATCH_REQUIRE(!table.check({"mallory", "secret"}).has_value());
  }

  CATCH_SECTION("malformed lines are reported by number") {
    auto missing_level = AuthTable::parse("alice:secret:admin\nbob:secret\n");
    CATCH_REQUIRE(!missing_level.has_value());
    CATCH_REQUIRE(missing_level.error().starts_with("line 2:"));

    auto bad_level = AuthTable::parse("alice:secret:superuser");
    CATCH_REQUIRE(!bad_level.has_value());
    CATCH_REQUIRE(bad_level.error().find("superuser") != string::npos);

    CATCH_REQUIRE(!AuthTable::parse(":secret:admin").has_value());
  }

  CATCH_SECTION("load") {
    const auto path = std::filesystem::temp_directory_path() / "haul-auth_tc.auth";
    {
      std::ofstream out{path};
      out << "alice:secret:10\n";
    }
    auto table = AuthTable::load(path);
    std::filesystem::remove(path);
    CATCH_REQUIRE(table.has_value());
    CATCH_REQUIRE(table->check({"alice", "secret"}) == AuthLevel::ADMIN);

    CATCH_REQUIRE(!AuthTable::load("/nonexistent/haul.auth").has_value());
  }
}

} // namespace haul::tests
