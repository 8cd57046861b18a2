
#include "request-processor.hpp"

#include "haul/net/envelope.hpp"
#include "haul/utils/string-utils.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace haul {

namespace asio = boost::asio;

using rpc::Fault;
using rpc::FaultKind;
using rpc::Request;
using rpc::Response;

namespace {

  /**
   * A call in flight. Whichever of the handler and the timeout finishes first answers it.
   */
  struct PendingCall {
    Request request;
    asio::strand<asio::any_io_executor> strand; //!< Serializes operations on `timer`
    asio::steady_timer timer;
    std::atomic<bool> has_finished{false};

    PendingCall(Request request_, const asio::any_io_executor& executor)
        : request{std::move(request_)}, strand{asio::make_strand(executor)}, timer{executor} {}

    /// @return true for the first caller only
    bool finish() { return !has_finished.exchange(true, std::memory_order_acq_rel); }
  };

} // namespace

RequestProcessor::RequestProcessor(SessionManager& sessions, const RpcDispatcher& dispatcher,
                                   asio::any_io_executor executor, Config config)
    : sessions_{sessions}, dispatcher_{dispatcher}, executor_{std::move(executor)},
      config_{config} {}

// ----------------------------------------------------------------------------------------- deliver

void RequestProcessor::deliver_(const shared_ptr<Session>& session,
                                const Response& response) const {
  net::BufferType buffer;
  if (!net::encode(buffer, response)) {
    LOG_ERR("failed to encode the response to request {}", response.request_id);
    const auto fallback = Response::failure(
        response.request_id, Fault{FaultKind::HANDLER_ERROR, "result could not be encoded"});
    if (!net::encode(buffer, fallback))
      return;
  }

  if (!session->enqueue_response(std::move(buffer))) {
    TRACE("session {} closed, response to request {} discarded", session->id(),
          response.request_id);
    return;
  }
  if (auto connection = session->connection())
    connection->notify_outbound();
}

// ----------------------------------------------------------------------------------------- process

bool RequestProcessor::process(const shared_ptr<Session>& session,
                               std::span<const std::byte> frame) {
  auto envelope = net::decode_envelope(frame);
  if (!envelope) {
    WARN("session {} sent a malformed frame: {}", session->id(), envelope.error().message());
    TRACE("malformed frame:\n{}", str(frame));
    sessions_.close(*session, format("protocol error: {}", envelope.error().message()));
    return false;
  }

  auto* request = std::get_if<Request>(&*envelope);
  if (request == nullptr) {
    WARN("session {} sent a message that is not a request", session->id());
    sessions_.close(*session, "protocol error: expected a request");
    return false;
  }

  if (!session->is_open())
    return true;
  session->touch();

  auto call = make_shared<PendingCall>(std::move(*request), executor_);

  if (config_.call_timeout.count() > 0) {
    asio::post(call->strand, [this, call, session]() {
      call->timer.expires_after(config_.call_timeout);
      call->timer.async_wait(
          asio::bind_executor(call->strand, [this, call, session](boost::system::error_code ec) {
            if (ec || !call->finish())
              return;
            timeouts_.fetch_add(1, std::memory_order_relaxed);
            WARN("operation '{}' timed out after {}ms", call->request.operation,
                 config_.call_timeout.count());
            Fault fault{FaultKind::TIMEOUT,
                        format("operation '{}' timed out", call->request.operation)};
            deliver_(session, Response::failure(call->request.request_id, std::move(fault)));
          }));
    });
  }

  asio::post(executor_, [this, call, session]() {
    auto response = dispatcher_.dispatch(session, call->request);
    if (!call->finish()) {
      TRACE("late result of '{}' discarded", call->request.operation);
      return;
    }
    if (config_.call_timeout.count() > 0)
      asio::post(call->strand, [call]() { call->timer.cancel(); });
    deliver_(session, response);
  });

  return true;
}

} // namespace haul
