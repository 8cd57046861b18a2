#pragma once

#include "haul/utils/base-include.hpp"

#include <chrono>
#include <iosfwd>

namespace haul {

/**
 * @brief Everything `hauld` can be told on the command line.
 */
struct DaemonConfig {
  bool show_help = false;

  // @{ Transport
  string address = "0.0.0.0";
  uint16_t port = 58846;
  string certificate_chain_file = {};
  string private_key_file = {};
  string dh_file = {}; //!< Optional
  bool enable_compression = false;
  std::size_t max_message_size = 16 * 1024 * 1024;
  std::size_t max_connections = 0; //!< Zero is unlimited
  // @}

  string auth_file = {}; //!< Without one, nobody can log in

  // @{ Execution
  std::size_t io_threads = 1;
  std::size_t worker_threads = 4;
  std::chrono::milliseconds call_timeout = std::chrono::seconds{30};
  std::chrono::milliseconds update_interval = std::chrono::seconds{1};
  // @}

  // @{ Sessions
  std::chrono::milliseconds idle_timeout = std::chrono::minutes{10};
  std::chrono::milliseconds id_grace_period = std::chrono::seconds{30};
  uint32_t max_login_attempts = 3;
  std::size_t queue_capacity = 1024;
  // @}

  vector<string> plugins = {}; //!< Loaded at startup, by name or shared object path
  string log_level = {};       //!< Empty leaves the logger alone

  /**
   * @return The configuration, or a list of errors.
   */
  static expected<DaemonConfig, vector<string>> parse(int argc, char** argv);

  static void show_help_message(std::ostream& out, std::string_view exec);
};

} // namespace haul
