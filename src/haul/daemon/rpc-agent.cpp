
#include "rpc-agent.hpp"

namespace haul {

RpcAgent::RpcAgent(SessionManager& sessions, RequestProcessor& processor)
    : sessions_{sessions}, processor_{processor} {}

RpcAgent::~RpcAgent() {
  if (session_)
    sessions_.close(*session_, "connection released");
}

shared_ptr<RpcAgent> RpcAgent::make(SessionManager& sessions, RequestProcessor& processor) {
  auto agent = make_shared<RpcAgent>(sessions, processor);
  agent->session_ = sessions.open(std::weak_ptr<Connection>{agent});
  return agent;
}

// -------------------------------------------------------------------------------------- Connection

void RpcAgent::pump_() {
  std::lock_guard lock{padlock_};
  while (!is_disconnecting_ && in_flight_ < k_max_in_flight) {
    auto buffer = session_->pop_outbound();
    if (!buffer)
      break;
    if (!send_message(std::move(*buffer)))
      break;
    ++in_flight_;
  }
}

void RpcAgent::notify_outbound() { pump_(); }

void RpcAgent::disconnect(std::string_view reason) {
  {
    std::lock_guard lock{padlock_};
    if (is_disconnecting_)
      return;
    is_disconnecting_ = true;
  }
  close(1000, reason.substr(0, 120)); // control frames are limited to 125 bytes
}

// -------------------------------------------------------------------------------- WebsocketSession

void RpcAgent::on_connect() {
  sessions_.handshake_complete(*session_);
  INFO("session {} connected from {}", session_->id(), remote_address());
}

void RpcAgent::on_receive(std::span<const std::byte> payload) {
  if (!processor_.process(session_, payload))
    TRACE("session {} dropped after a protocol error", session_->id());
}

void RpcAgent::on_close(uint16_t close_code, std::string_view reason) {
  sessions_.close(*session_, format("connection closed by peer ({}) {}", close_code, reason));
}

void RpcAgent::on_error(net::WebsocketOperation operation, std::error_code ec) {
  sessions_.close(*session_, format("{} error: {}", str(operation), ec.message()));
}

void RpcAgent::on_return_buffer(net::BufferType&&) {
  {
    std::lock_guard lock{padlock_};
    if (in_flight_ > 0)
      --in_flight_;
  }
  pump_();
}

} // namespace haul
