#pragma once

#include "request-processor.hpp"
#include "session-manager.hpp"
#include "session.hpp"

#include "haul/net/websockets/websocket-session.hpp"
#include "haul/utils/base-include.hpp"

#include <mutex>

namespace haul {

/**
 * @brief The daemon's end of one client connection.
 *
 * Inbound frames go to the request processor. Outbound messages are pulled from the
 * session's queue, with at most `k_max_in_flight` handed to the websocket at a time, so
 * the session queue's capacity is what bounds a slow client.
 */
class RpcAgent final : public net::WebsocketSession,
                       public Connection,
                       public std::enable_shared_from_this<RpcAgent> {
public:
  static constexpr std::size_t k_max_in_flight = 8;

private:
  SessionManager& sessions_;
  RequestProcessor& processor_;
  shared_ptr<Session> session_;

  std::mutex padlock_;
  std::size_t in_flight_{0};
  bool is_disconnecting_{false};

  void pump_();

public:
  RpcAgent(SessionManager& sessions, RequestProcessor& processor);
  ~RpcAgent() override;

  /** @brief Create an agent, and open its session */
  static shared_ptr<RpcAgent> make(SessionManager& sessions, RequestProcessor& processor);

  const shared_ptr<Session>& session() const { return session_; }

  // @{ Connection
  void notify_outbound() override;
  void disconnect(std::string_view reason) override;
  // @}

  // @{ WebsocketSession
  void on_connect() override;
  void on_receive(std::span<const std::byte> payload) override;
  void on_close(uint16_t close_code, std::string_view reason) override;
  void on_error(net::WebsocketOperation operation, std::error_code ec) override;
  void on_return_buffer(net::BufferType&& buffer) override;
  // @}
};

} // namespace haul
