#pragma once

#include "websocket-session.hpp"

#include "haul/utils.hpp"

namespace boost::asio {
class io_context;
}

namespace haul::net {

// --------------------------------------------------------------------------------- WebsocketServer

/**
 * @brief Accepts TLS websocket connections, and hands each to a fresh `WebsocketSession`.
 */
class WebsocketServer {
private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

public:
  struct Config {
    string address = "0.0.0.0";
    uint16_t port = 0; //!< Zero picks a free port
    string certificate_chain_file = {};
    string private_key_file = {};
    string dh_file = {};             //!< Optional
    std::size_t max_connections = 0; //!< Zero is unlimited
    WebsocketOptions options = {};

    /** @brief Must be set, and must neither throw nor return null */
    std::function<std::shared_ptr<WebsocketSession>()> session_factory;
  };

  /**
   * Exceptions
   * + std::runtime_error When the certificate or key cannot be loaded
   */
  WebsocketServer(boost::asio::io_context& io_context, const Config& config);
  WebsocketServer(const WebsocketServer&) = delete;
  WebsocketServer& operator=(const WebsocketServer&) = delete;
  ~WebsocketServer();

  /** @brief Bind, listen and start accepting */
  std::error_code run();

  /** @brief The bound port, once running */
  uint16_t port() const;

  /** @brief The number of connections currently open */
  std::size_t connection_count() const;

  /** @brief Stop accepting, and cancel every open connection */
  void shutdown();
};

} // namespace haul::net
