#pragma once

#include "buffer.hpp"

#include "haul/net/websockets/websocket-session.hpp"
#include "haul/rpc/message.hpp"
#include "haul/utils/base-include.hpp"

#include <atomic>
#include <future>
#include <mutex>

namespace haul::net {

/**
 * @brief The client end of a daemon connection: makes calls, and receives events.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto client = std::make_shared<RpcClient>();
 * connect(client, io_context, "localhost", 58846);
 * if (client->connected().get()) {
 *   auto response = client->call("daemon.login", {"user", "secret"}).get();
 * }
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class RpcClient : public WebsocketSession {
public:
  using CompletionHandler = std::function<void(rpc::Response response)>;
  using EventCallback = std::function<void(rpc::Event event)>;

private:
  mutable std::mutex padlock_;
  std::atomic<uint64_t> next_request_id_{1};
  std::unordered_map<uint64_t, CompletionHandler> outstanding_calls_;
  EventCallback on_event_;
  std::promise<bool> connected_promise_;
  std::shared_future<bool> connected_;
  bool connected_is_set_{false};

  void set_connected_(bool value);
  void fail_outstanding_(std::string_view reason);

public:
  RpcClient();
  ~RpcClient() override;

  /** @brief Resolves to true once connected, or false if the connection failed */
  std::shared_future<bool> connected() const { return connected_; }

  /** @brief Called for every event the daemon sends */
  void set_event_callback(EventCallback callback);

  /**
   * @brief Make a call; `completion` receives the response, or a `PROTOCOL_ERROR` fault if
   * the connection is lost first.
   * @return The request id.
   */
  uint64_t call(string operation, rpc::Value::List args, rpc::Value::Dict kwargs,
                CompletionHandler completion);

  std::future<rpc::Response> call(string operation, rpc::Value::List args = {},
                                  rpc::Value::Dict kwargs = {});

  std::size_t outstanding() const;

  void on_connect() override;
  void on_receive(std::span<const std::byte> payload) override;
  void on_close(uint16_t close_code, std::string_view reason) override;
  void on_error(WebsocketOperation operation, std::error_code ec) override;
};

} // namespace haul::net
