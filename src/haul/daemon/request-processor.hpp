#pragma once

#include "rpc-dispatcher.hpp"
#include "session-manager.hpp"
#include "session.hpp"

#include "haul/utils/base-include.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <chrono>
#include <span>

namespace haul {

// -------------------------------------------------------------------------------- RequestProcessor

/**
 * @brief Turns inbound frames into dispatched calls, and their responses into outbound
 * messages.
 *
 * Each request is dispatched on the worker executor, so a slow handler only holds up its
 * own call. With a call timeout set, a handler that runs too long is answered with a
 * `TIMEOUT` fault; it keeps running, and its eventual result is discarded. Requests on the
 * same session may complete out of order.
 *
 * A frame that does not decode, or that is not a request, is a protocol error and closes
 * the session.
 */
class RequestProcessor {
public:
  struct Config {
    std::chrono::milliseconds call_timeout{0}; //!< zero disables
  };

private:
  SessionManager& sessions_;
  const RpcDispatcher& dispatcher_;
  boost::asio::any_io_executor executor_;
  const Config config_;
  std::atomic<uint64_t> timeouts_{0};

  void deliver_(const shared_ptr<Session>& session, const rpc::Response& response) const;

public:
  RequestProcessor(SessionManager& sessions, const RpcDispatcher& dispatcher,
                   boost::asio::any_io_executor executor, Config config);
  RequestProcessor(const RequestProcessor&) = delete;
  RequestProcessor& operator=(const RequestProcessor&) = delete;

  /**
   * @brief Handle one inbound frame; `frame` need not outlive the call.
   * @return false if the frame was a protocol error, and the session was closed.
   */
  bool process(const shared_ptr<Session>& session, std::span<const std::byte> frame);

  /** @brief The number of calls answered with `TIMEOUT` */
  uint64_t timeouts() const { return timeouts_.load(std::memory_order_relaxed); }
};

} // namespace haul
