
#include "stdinc.hpp"

#include "haul/utils/cli-utils.hpp"

#include <catch2/catch_all.hpp>

namespace haul::cli::tests {
CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  CATCH_SECTION("safe-args") {
    std::vector<std::string> args = parse_cmd_args("exec-name 1 two three");
    std::vector<char*> argv_s;
    int argc = int(args.size());
    for (auto i = 0; i < argc; ++i)
      argv_s.push_back(args[i].data());
    char** argv = argv_s.data();

    int i = 0;
    CATCH_REQUIRE(safe_arg_int(argc, argv, i) == 1);
    CATCH_REQUIRE(i == 1);
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "two");
    CATCH_REQUIRE(i == 2);
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "three");
    CATCH_REQUIRE(i == 3);
    CATCH_REQUIRE_THROWS_AS(safe_arg_str(argc, argv, i), std::runtime_error);
  }

  CATCH_SECTION("safe-arg-int rejects garbage") {
    std::vector<std::string> args = parse_cmd_args("exec-name --port 12x");
    std::vector<char*> argv_s;
    for (auto& arg : args)
      argv_s.push_back(arg.data());
    int i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(int(argv_s.size()), argv_s.data(), i), std::runtime_error);
  }

  CATCH_SECTION("parse-cmd-args handles quotes") {
    const auto args = parse_cmd_args(R"(hauld --plugin 'my plugin' "a \"b\"")");
    CATCH_REQUIRE(args.size() == 4);
    CATCH_REQUIRE(args[2] == "my plugin");
    CATCH_REQUIRE(args[3] == "a \"b\"");
  }
}
} // namespace haul::cli::tests
