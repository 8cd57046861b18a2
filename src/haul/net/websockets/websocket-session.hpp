#pragma once

#include "haul/utils.hpp"

#include "haul/net/buffer.hpp"

namespace boost::asio {
class io_context;
}

namespace haul::net::detail {
class Stream;
}

namespace haul::net {

/**
 * @brief The stage a connection was at when it failed.
 */
enum class WebsocketOperation : int {
  CONNECT,   //!< Client side resolve and tcp connect
  HANDSHAKE, //!< TLS handshake
  ACCEPT,    //!< Websocket upgrade
  READ,
  WRITE,
  CLOSE
};

constexpr std::string_view str(WebsocketOperation op) {
  switch (op) {
  case WebsocketOperation::CONNECT: return "connect";
  case WebsocketOperation::HANDSHAKE: return "tls-handshake";
  case WebsocketOperation::ACCEPT: return "websocket-upgrade";
  case WebsocketOperation::READ: return "read";
  case WebsocketOperation::WRITE: return "write";
  case WebsocketOperation::CLOSE: return "close";
  }
  return "<unknown operation>";
}

/**
 * @brief Per-connection stream options; both ends must agree on compression.
 */
struct WebsocketOptions {
  bool enable_compression = false;                 //!< Offer/accept permessage-deflate
  std::size_t max_message_size = 16 * 1024 * 1024; //!< Larger inbound messages are an error
  std::chrono::milliseconds handshake_timeout{30 * 1000}; //!< Connect, TLS and upgrade
};

// -------------------------------------------------------------------------------- WebsocketSession

/**
 * A `WebsocketSession` is the application's end of one TLS encrypted websocket. Every
 * message it sends or receives is a binary message, carrying one encoded envelope.
 *
 * A server creates one per accepted connection through its `session_factory`. A client
 * creates one itself and hands it to `connect`.
 *
 * The callbacks are called on the connection's strand, so they are never concurrent for
 * one session; they must not block.
 *
 * @see WebsocketServer::Config
 */
class WebsocketSession {
private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;
  friend class detail::Stream;

public:
  WebsocketSession();
  virtual ~WebsocketSession();

  /**
   * @brief Start a close handshake; `on_close` follows once the peer answers.
   * @see https://datatracker.ietf.org/doc/html/rfc6455#section-7.4.1
   */
  void close(uint16_t close_code = 1000, std::string_view reason = "");

  /**
   * @brief Queue a message for the other end. Messages are written in the order queued,
   * and each buffer comes back through `on_return_buffer`.
   * @return false if there is no connection.
   */
  bool send_message(BufferType&& buffer);

  /** @brief True between `on_connect` and the connection finishing */
  bool is_connected() const;

  /** @brief "address:port" of the other end, once known */
  string remote_address() const;

  virtual void on_connect() {}

  /**
   * @brief One complete inbound message. Must not throw.
   *
   * `payload` is only valid during the call.
   */
  virtual void on_receive(std::span<const std::byte> payload) = 0;

  /** @brief The close handshake completed */
  virtual void on_close(uint16_t close_code, std::string_view reason) {}

  /** @brief The connection failed, and is finished */
  virtual void on_error(WebsocketOperation operation, std::error_code ec) {}

  /** @brief A buffer passed to `send_message` has been written, or abandoned */
  virtual void on_return_buffer(BufferType&& buffer) {}
};

/**
 * @brief Open a client connection to `host:port`.
 *
 * The driver holds `session` until the connection finishes. The server's certificate is
 * not verified.
 */
void connect(std::shared_ptr<WebsocketSession> session, //
             boost::asio::io_context& io_context,       //
             std::string_view host,                     //
             uint16_t port,                             //
             WebsocketOptions options = {});            //

} // namespace haul::net
