#include "stdinc.hpp"

#include "haul/net/asio-execution-context.hpp"
#include "haul/net/rpc-client.hpp"

#include <charconv>

// Calls one operation on a running daemon, and prints the result:
//
//   haul-call -u alice -p secret job.add http://example.com/file.iso

namespace haul::example {

struct Config {
  bool show_help{false};
  string host{"localhost"};
  uint16_t port{58846};
  string username{};
  string password{};
  string operation{};
  rpc::Value::List args{};
};

static rpc::Value parse_value(const string& arg) {
  int64_t x = 0;
  const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), x);
  if (ec == std::errc{} && ptr == arg.data() + arg.size())
    return x;
  return arg;
}

int call_main(int argc, char** argv) {
  Config config;
  auto has_error = false;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];
    try {
      if (arg == "-h" || arg == "--help") {
        config.show_help = true;
      } else if (arg == "--host") {
        config.host = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--port") {
        config.port = static_cast<uint16_t>(cli::safe_arg_int(argc, argv, i));
      } else if (arg == "-u") {
        config.username = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "-p") {
        config.password = cli::safe_arg_str(argc, argv, i);
      } else if (config.operation.empty()) {
        config.operation = arg;
      } else {
        config.args.push_back(parse_value(arg));
      }
    } catch (std::runtime_error& e) {
      std::cout << format("Error on command-line: {}", e.what()) << std::endl;
      has_error = true;
    }
  }

  if (config.show_help) {
    std::cout << format("Usage: {} [--host <host>] [--port <port>] [-u <user> -p <password>] "
                        "<operation> [args...]",
                        argv[0])
              << std::endl;
    return EXIT_SUCCESS;
  }

  if (config.operation.empty()) {
    std::cout << "must specify an operation" << std::endl;
    has_error = true;
  }

  if (has_error) {
    std::cout << "aborting..." << std::endl;
    return EXIT_FAILURE;
  }

  net::AsioExecutionContext context{1};
  auto client = std::make_shared<net::RpcClient>();
  net::connect(client, context.io_context(), config.host, config.port);
  context.run();

  if (!client->connected().get()) {
    LOG_ERR("failed to connect to {}:{}", config.host, config.port);
    return EXIT_FAILURE;
  }

  if (!config.username.empty()) {
    auto login = client->call("daemon.login", {config.username, config.password}).get();
    if (!login.ok()) {
      LOG_ERR("login failed: {}", login.fault.message());
      return EXIT_FAILURE;
    }
  }

  auto response = client->call(config.operation, config.args).get();
  client->close(1000, "done");

  if (!response.ok()) {
    std::cout << format("{}: {} {}", str(response.fault.kind()), response.fault.message(),
                        response.fault.details())
              << std::endl;
    return EXIT_FAILURE;
  }
  std::cout << response.result.to_string() << std::endl;
  return EXIT_SUCCESS;
}

} // namespace haul::example

int main(int argc, char** argv) { return haul::example::call_main(argc, argv); }
