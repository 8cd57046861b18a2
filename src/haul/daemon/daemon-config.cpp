
#include "daemon-config.hpp"

#include "haul/utils/cli-utils.hpp"

#include <stdexcept>

namespace haul {

namespace {
  int non_negative_arg(int argc, char** argv, int& i) {
    const string arg = argv[i];
    const auto value = cli::safe_arg_int(argc, argv, i);
    if (value < 0)
      throw std::runtime_error(format("argument '{}' cannot be negative", arg));
    return value;
  }

  int positive_arg(int argc, char** argv, int& i) {
    const string arg = argv[i];
    const auto value = cli::safe_arg_int(argc, argv, i);
    if (value <= 0)
      throw std::runtime_error(format("argument '{}' must be positive", arg));
    return value;
  }
} // namespace

void DaemonConfig::show_help_message(std::ostream& out, std::string_view exec) {
  const DaemonConfig defaults;
  out << format(R"V0G0N(

   Usage: {} [OPTIONS...] --cert <filename> --key <filename>

      -a|--address <addr>         Address to listen on. Default is {}.
      -p|--port <integer>         Port to listen on. Default is {}.
      --cert <filename>           Certificate chain file (PEM).
      --key <filename>            Private key file (PEM).
      --dh <filename>             Diffie-Hellman parameters file (PEM).
      --compression               Enable permessage-deflate.
      --max-message-size <bytes>  Largest message accepted. Default is {}.
      --max-connections <integer> Connections accepted at once; 0 is unlimited. Default is {}.

      --auth <filename>           Credentials file, with lines "username:password:level".

      --io-threads <integer>      Threads servicing sockets. Default is {}.
      --workers <integer>         Threads running operations. Default is {}.
      --call-timeout <millis>     Time an operation may take; 0 disables. Default is {}.
      --update-interval <millis>  Period of component updates. Default is {}.

      --idle-timeout <seconds>    Sessions idle this long are closed; 0 disables. Default is {}.
      --id-grace <seconds>        Time before a session id is reused. Default is {}.
      --max-login-attempts <int>  Failed logins before a session is closed. Default is {}.
      --queue-capacity <integer>  Outbound messages held per session. Default is {}.

      --plugin <name|path.so>     Load a plugin at startup. May be repeated.
      --log-level <level>         One of trace, debug, info, warn, error, critical, off.

)V0G0N",
                exec, defaults.address, defaults.port, defaults.max_message_size,
                defaults.max_connections, defaults.io_threads, defaults.worker_threads,
                defaults.call_timeout.count(),
                defaults.update_interval.count(),
                std::chrono::duration_cast<std::chrono::seconds>(defaults.idle_timeout).count(),
                std::chrono::duration_cast<std::chrono::seconds>(defaults.id_grace_period).count(),
                defaults.max_login_attempts, defaults.queue_capacity);
}

expected<DaemonConfig, vector<string>> DaemonConfig::parse(int argc, char** argv) {
  DaemonConfig config;
  vector<string> errors;

  for (int i = 1; i < argc; ++i) {
    const string arg = argv[i];
    try {
      if (arg == "-h" || arg == "--help") {
        config.show_help = true;
      } else if (arg == "-a" || arg == "--address") {
        config.address = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "-p" || arg == "--port") {
        const auto port = non_negative_arg(argc, argv, i);
        if (port > std::numeric_limits<uint16_t>::max())
          throw std::runtime_error(format("port out of range: {}", port));
        config.port = static_cast<uint16_t>(port);
      } else if (arg == "--cert") {
        config.certificate_chain_file = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--key") {
        config.private_key_file = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--dh") {
        config.dh_file = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--compression") {
        config.enable_compression = true;
      } else if (arg == "--max-message-size") {
        config.max_message_size = std::size_t(positive_arg(argc, argv, i));
      } else if (arg == "--max-connections") {
        config.max_connections = std::size_t(non_negative_arg(argc, argv, i));
      } else if (arg == "--auth") {
        config.auth_file = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--io-threads") {
        config.io_threads = std::size_t(positive_arg(argc, argv, i));
      } else if (arg == "--workers") {
        config.worker_threads = std::size_t(positive_arg(argc, argv, i));
      } else if (arg == "--call-timeout") {
        config.call_timeout = std::chrono::milliseconds{non_negative_arg(argc, argv, i)};
      } else if (arg == "--update-interval") {
        config.update_interval = std::chrono::milliseconds{positive_arg(argc, argv, i)};
      } else if (arg == "--idle-timeout") {
        config.idle_timeout = std::chrono::seconds{non_negative_arg(argc, argv, i)};
      } else if (arg == "--id-grace") {
        config.id_grace_period = std::chrono::seconds{non_negative_arg(argc, argv, i)};
      } else if (arg == "--max-login-attempts") {
        config.max_login_attempts = uint32_t(positive_arg(argc, argv, i));
      } else if (arg == "--queue-capacity") {
        config.queue_capacity = std::size_t(positive_arg(argc, argv, i));
      } else if (arg == "--plugin") {
        config.plugins.push_back(cli::safe_arg_str(argc, argv, i));
      } else if (arg == "--log-level") {
        config.log_level = cli::safe_arg_str(argc, argv, i);
      } else {
        errors.push_back(format("unexpected argument: '{}'", arg));
      }
    } catch (std::runtime_error& e) {
      errors.push_back(format("error on command-line: {}", e.what()));
    }
  }

  if (!config.show_help) {
    if (config.certificate_chain_file.empty())
      errors.push_back("must specify a certificate chain file with --cert");
    if (config.private_key_file.empty())
      errors.push_back("must specify a private key file with --key");
  }

  if (!errors.empty())
    return make_unexpected(std::move(errors));
  return config;
}

} // namespace haul
