
// We know that `main.cpp` is going to be first in unity builds.
// Therefore, we include our precompiled header here, so that it
// is first in the unity (testcases) build.
#include "stdinc.hpp"

#include "haul/daemon/auth.hpp"
#include "haul/daemon/daemon-config.hpp"
#include "haul/daemon/daemon.hpp"

#include <boost/asio/signal_set.hpp>

#include <csignal>

namespace haul {

int main(int argc, char** argv) {
  auto config = DaemonConfig::parse(argc, argv);
  if (!config) {
    for (const auto& message : config.error())
      std::cerr << message << std::endl;
    std::cerr << "aborting..." << std::endl;
    return EXIT_FAILURE;
  }

  if (config->show_help) {
    DaemonConfig::show_help_message(std::cout, argv[0]);
    return EXIT_SUCCESS;
  }

  if (!config->log_level.empty() && !logging::set_level(config->log_level)) {
    std::cerr << format("unknown log level: '{}'", config->log_level) << std::endl;
    return EXIT_FAILURE;
  }

  auto auth = make_shared<AuthTable>();
  if (config->auth_file.empty()) {
    WARN("no auth file given, so no client will be able to log in");
  } else {
    auto loaded = AuthTable::load(config->auth_file);
    if (!loaded) {
      LOG_ERR("failed to load auth file '{}': {}", config->auth_file, loaded.error());
      return EXIT_FAILURE;
    }
    auth = make_shared<AuthTable>(std::move(*loaded));
  }

  try {
    Daemon daemon{std::move(*config), std::move(auth)};
    if (auto ec = daemon.start()) {
      LOG_ERR("failed to start the daemon: {}", ec.message());
      return EXIT_FAILURE;
    }

    // Signals are caught on their own io context, so that the daemon's threads are never
    // interrupted.
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals{signal_context, SIGINT, SIGTERM};
    signals.async_wait([&daemon](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        INFO("caught signal {}", signal_number);
        daemon.request_shutdown();
      }
    });
    std::thread signal_thread{[&signal_context]() { signal_context.run(); }};

    daemon.wait();
    daemon.stop();

    signal_context.stop();
    signal_thread.join();
  } catch (std::runtime_error& e) {
    LOG_ERR("fatal error: {}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

} // namespace haul

// Don't compile in main(...) if we're doing a testcase build
#ifndef CATCH_BUILD

int main(int argc, char** argv) { return haul::main(argc, argv); }

#endif
