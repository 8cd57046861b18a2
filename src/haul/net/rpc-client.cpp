
#include "rpc-client.hpp"

#include "envelope.hpp"

namespace haul::net {

using rpc::Fault;
using rpc::FaultKind;
using rpc::Response;

RpcClient::RpcClient() : connected_{connected_promise_.get_future().share()} {}

RpcClient::~RpcClient() = default;

void RpcClient::set_connected_(bool value) {
  std::lock_guard lock{padlock_};
  if (!connected_is_set_) {
    connected_is_set_ = true;
    connected_promise_.set_value(value);
  }
}

void RpcClient::set_event_callback(EventCallback callback) {
  std::lock_guard lock{padlock_};
  on_event_ = std::move(callback);
}

std::size_t RpcClient::outstanding() const {
  std::lock_guard lock{padlock_};
  return outstanding_calls_.size();
}

// -------------------------------------------------------------------------------------------- call

uint64_t RpcClient::call(string operation, rpc::Value::List args, rpc::Value::Dict kwargs,
                         CompletionHandler completion) {
  const auto request_id = next_request_id_.fetch_add(1, std::memory_order_relaxed);
  const rpc::Request request{request_id, std::move(operation), std::move(args), std::move(kwargs)};

  BufferType buffer;
  if (!encode(buffer, request)) {
    completion(Response::failure(request_id,
                                 Fault{FaultKind::PROTOCOL_ERROR, "request could not be encoded"}));
    return request_id;
  }

  {
    std::lock_guard lock{padlock_};
    outstanding_calls_.insert({request_id, std::move(completion)});
  }

  if (!send_message(std::move(buffer))) {
    CompletionHandler handler;
    {
      std::lock_guard lock{padlock_};
      auto ii = outstanding_calls_.find(request_id);
      if (ii != outstanding_calls_.end()) {
        handler = std::move(ii->second);
        outstanding_calls_.erase(ii);
      }
    }
    if (handler)
      handler(Response::failure(request_id, Fault{FaultKind::PROTOCOL_ERROR, "not connected"}));
  }
  return request_id;
}

std::future<Response> RpcClient::call(string operation, rpc::Value::List args,
                                      rpc::Value::Dict kwargs) {
  auto promise = make_shared<std::promise<Response>>();
  auto future = promise->get_future();
  call(std::move(operation), std::move(args), std::move(kwargs),
       [promise](Response response) { promise->set_value(std::move(response)); });
  return future;
}

// --------------------------------------------------------------------------------------- callbacks

void RpcClient::on_connect() { set_connected_(true); }

void RpcClient::on_receive(std::span<const std::byte> payload) {
  auto envelope = decode_envelope(payload);
  if (!envelope) {
    WARN("malformed message from the daemon: {}", envelope.error().message());
    close(1002, "protocol error");
    return;
  }

  if (auto* response = std::get_if<Response>(&*envelope)) {
    CompletionHandler handler;
    {
      std::lock_guard lock{padlock_};
      auto ii = outstanding_calls_.find(response->request_id);
      if (ii != outstanding_calls_.end()) {
        handler = std::move(ii->second);
        outstanding_calls_.erase(ii);
      }
    }
    if (handler)
      handler(std::move(*response));
    else
      WARN("response to unknown request {}", response->request_id);
  } else if (auto* event = std::get_if<rpc::Event>(&*envelope)) {
    EventCallback callback;
    {
      std::lock_guard lock{padlock_};
      callback = on_event_;
    }
    if (callback)
      callback(std::move(*event));
  } else {
    WARN("the daemon sent a request");
  }
}

void RpcClient::fail_outstanding_(std::string_view reason) {
  decltype(outstanding_calls_) calls;
  {
    std::lock_guard lock{padlock_};
    using std::swap;
    swap(calls, outstanding_calls_);
  }
  for (auto& [request_id, handler] : calls)
    handler(Response::failure(request_id, Fault{FaultKind::PROTOCOL_ERROR, string{reason}}));
}

void RpcClient::on_close(uint16_t close_code, std::string_view reason) {
  set_connected_(false);
  fail_outstanding_(format("connection closed ({}) {}", close_code, reason));
}

void RpcClient::on_error(WebsocketOperation operation, std::error_code ec) {
  set_connected_(false);
  fail_outstanding_(format("{} error: {}", str(operation), ec.message()));
}

} // namespace haul::net
