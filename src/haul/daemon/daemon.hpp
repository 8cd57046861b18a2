#pragma once

#include "auth.hpp"
#include "component.hpp"
#include "daemon-config.hpp"
#include "event-manager.hpp"
#include "job-engine.hpp"
#include "plugin-manager.hpp"
#include "request-processor.hpp"
#include "rpc-dispatcher.hpp"
#include "session-manager.hpp"

#include "haul/net/asio-execution-context.hpp"
#include "haul/net/websockets/websocket-server.hpp"
#include "haul/utils/base-include.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace haul {

constexpr std::string_view k_daemon_version = "0.1.0";

// ------------------------------------------------------------------------------------------ Daemon

/**
 * @brief The whole daemon: transport, sessions, dispatch, events, plugins and jobs.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * Daemon daemon{config, auth_table};
 * if (!daemon.start()) {
 *   daemon.wait(); // until `request_shutdown`
 *   daemon.stop();
 * }
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class Daemon {
private:
  const DaemonConfig config_;

  unique_ptr<net::AsioExecutionContext> io_;
  boost::asio::thread_pool workers_;

  EventManager events_;
  RpcDispatcher dispatcher_;
  shared_ptr<SessionManager> sessions_;
  shared_ptr<MemoryJobEngine> jobs_;
  shared_ptr<PluginManager> plugins_;
  ComponentRegistry components_;
  unique_ptr<RequestProcessor> processor_;
  unique_ptr<net::WebsocketServer> server_;
  unique_ptr<boost::asio::steady_timer> update_timer_;

  std::mutex padlock_;
  std::condition_variable shutdown_cv_;
  bool shutdown_requested_{false};
  std::atomic<bool> is_stopping_{false};
  bool is_started_{false};

  void schedule_update_();

public:
  Daemon(DaemonConfig config, shared_ptr<const AuthTable> auth);
  Daemon(const Daemon&) = delete;
  Daemon& operator=(const Daemon&) = delete;
  ~Daemon();

  /**
   * @brief Register the built-in operations, load configured plugins, start the
   * components, and start listening.
   *
   * Exceptions
   * + std::runtime_error When the certificate or key cannot be loaded
   */
  error_code start();

  /** @brief Wake up `wait`; safe to call from any thread, including handlers */
  void request_shutdown();

  /** @brief Block until `request_shutdown` is called */
  void wait();

  /** @brief Orderly shutdown; must not be called from a daemon thread */
  void stop();

  /** @brief The listening port, once started */
  uint16_t port() const;

  RpcDispatcher& dispatcher() { return dispatcher_; }
  SessionManager& sessions() { return *sessions_; }
  EventManager& events() { return events_; }
  PluginManager& plugins() { return *plugins_; }
  MemoryJobEngine& jobs() { return *jobs_; }
  ComponentRegistry& components() { return components_; }
};

} // namespace haul
