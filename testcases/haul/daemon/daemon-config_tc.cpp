#include "stdinc.hpp"

#include "haul/daemon/daemon-config.hpp"
#include "haul/utils/cli-utils.hpp"

#include <catch2/catch_all.hpp>

#include <sstream>

namespace haul::tests {

using namespace std::chrono_literals;

namespace {
  /// Holds the strings that `argv` points into
  struct CommandLine {
    vector<string> args;
    vector<char*> argv;

    explicit CommandLine(std::string_view line) : args{cli::parse_cmd_args(line)} {
      for (auto& arg : args)
        argv.push_back(arg.data());
    }

    expected<DaemonConfig, vector<string>> parse() {
      return DaemonConfig::parse(int(argv.size()), argv.data());
    }
  };
} // namespace

CATCH_TEST_CASE("DaemonConfig", "[daemon-config]") {
  CATCH_SECTION("defaults") {
    CommandLine line{"hauld --cert server.crt --key server.key"};
    auto config = line.parse();
    CATCH_REQUIRE(config.has_value());
    CATCH_REQUIRE(!config->show_help);
    CATCH_REQUIRE(config->address == "0.0.0.0");
    CATCH_REQUIRE(config->port == 58846);
    CATCH_REQUIRE(config->certificate_chain_file == "server.crt");
    CATCH_REQUIRE(config->private_key_file == "server.key");
    CATCH_REQUIRE(config->dh_file.empty());
    CATCH_REQUIRE(!config->enable_compression);
    CATCH_REQUIRE(config->max_connections == 0);
    CATCH_REQUIRE(config->call_timeout == 30s);
    CATCH_REQUIRE(config->idle_timeout == 10min);
    CATCH_REQUIRE(config->max_login_attempts == 3);
    CATCH_REQUIRE(config->plugins.empty());
  }

  CATCH_SECTION("every option") {
    CommandLine line{"hauld -a 127.0.0.1 -p 9000 --cert c.pem --key k.pem --dh dh.pem "
                     "--compression --max-message-size 4096 --max-connections 16 "
                     "--auth users.txt --io-threads 2 --workers 8 --call-timeout 0 "
                     "--update-interval 250 --idle-timeout 60 "
                     "--id-grace 5 --max-login-attempts 5 --queue-capacity 64 "
                     "--plugin label --plugin /opt/haul/libextra.so --log-level debug"};
    auto config = line.parse();
    CATCH_REQUIRE(config.has_value());
    CATCH_REQUIRE(config->address == "127.0.0.1");
    CATCH_REQUIRE(config->port == 9000);
    CATCH_REQUIRE(config->dh_file == "dh.pem");
    CATCH_REQUIRE(config->enable_compression);
    CATCH_REQUIRE(config->max_message_size == 4096);
    CATCH_REQUIRE(config->max_connections == 16);
    CATCH_REQUIRE(config->auth_file == "users.txt");
    CATCH_REQUIRE(config->io_threads == 2);
    CATCH_REQUIRE(config->worker_threads == 8);
    CATCH_REQUIRE(config->call_timeout == 0ms);
    CATCH_REQUIRE(config->update_interval == 250ms);
    CATCH_REQUIRE(config->idle_timeout == 60s);
    CATCH_REQUIRE(config->id_grace_period == 5s);
    CATCH_REQUIRE(config->max_login_attempts == 5);
    CATCH_REQUIRE(config->queue_capacity == 64);
    CATCH_REQUIRE(config->plugins == vector<string>{"label", "/opt/haul/libextra.so"});
    CATCH_REQUIRE(config->log_level == "debug");
  }

  CATCH_SECTION("help needs no certificate") {
    CommandLine line{"hauld --help"};
    auto config = line.parse();
    CATCH_REQUIRE(config.has_value());
    CATCH_REQUIRE(config->show_help);

    std::stringstream ss;
    DaemonConfig::show_help_message(ss, "hauld");
    CATCH_REQUIRE(ss.str().find("Usage: hauld") != string::npos);
    CATCH_REQUIRE(ss.str().find("--plugin") != string::npos);
  }

  CATCH_SECTION("errors are collected") {
    CommandLine line{"hauld --bogus -p 70000 --workers 0 --queue-capacity"};
    auto config = line.parse();
    CATCH_REQUIRE(!config.has_value());
    const auto& errors = config.error();
    CATCH_REQUIRE(errors.size() == 6);
    CATCH_REQUIRE(errors[0] == "unexpected argument: '--bogus'");
    CATCH_REQUIRE(errors[1].starts_with("error on command-line: port out of range"));
    CATCH_REQUIRE(errors[2].starts_with("error on command-line:"));
    CATCH_REQUIRE(errors[3].starts_with("error on command-line:"));
    CATCH_REQUIRE(errors[4] == "must specify a certificate chain file with --cert");
    CATCH_REQUIRE(errors[5] == "must specify a private key file with --key");
  }

  CATCH_SECTION("negative durations are rejected") {
    CommandLine line{"hauld --cert c --key k --idle-timeout -1"};
    auto config = line.parse();
    CATCH_REQUIRE(!config.has_value());
    CATCH_REQUIRE(config.error().size() == 1);
  }
}

} // namespace haul::tests
