#pragma once

#include "haul/daemon/event-manager.hpp"
#include "haul/daemon/session-manager.hpp"
#include "haul/daemon/session.hpp"
#include "haul/net/envelope.hpp"
#include "haul/utils/base-include.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace haul::test {

// ---------------------------------------------------------------------------------- FakeConnection

/**
 * A connection that records what the daemon asked of it.
 */
class FakeConnection : public Connection {
private:
  mutable std::mutex padlock_;
  std::atomic<int> notified_{0};
  vector<string> disconnects_;

public:
  void notify_outbound() override { notified_.fetch_add(1, std::memory_order_acq_rel); }

  void disconnect(std::string_view reason) override {
    std::lock_guard lock{padlock_};
    disconnects_.emplace_back(reason);
  }

  int notified() const { return notified_.load(std::memory_order_acquire); }

  vector<string> disconnects() const {
    std::lock_guard lock{padlock_};
    return disconnects_;
  }
};

// ---------------------------------------------------------------------------------------- Fixtures

inline shared_ptr<const AuthTable> make_auth_table() {
  auto auth = make_shared<AuthTable>();
  auth->add("reader", "r-secret", AuthLevel::READ_ONLY);
  auth->add("user", "u-secret", AuthLevel::STANDARD);
  auth->add("admin", "a-secret", AuthLevel::ADMIN);
  return auth;
}

/**
 * A session with a fake connection, authenticated at `level`
 */
struct TestClient {
  shared_ptr<FakeConnection> connection = make_shared<FakeConnection>();
  shared_ptr<Session> session;

  TestClient(SessionManager& sessions, std::optional<AuthLevel> level) {
    session = sessions.open(connection);
    sessions.handshake_complete(*session);
    if (!level.has_value())
      return;
    switch (*level) {
    case AuthLevel::NONE: break;
    case AuthLevel::READ_ONLY: sessions.authenticate(*session, {"reader", "r-secret"}); break;
    case AuthLevel::STANDARD: sessions.authenticate(*session, {"user", "u-secret"}); break;
    case AuthLevel::ADMIN: sessions.authenticate(*session, {"admin", "a-secret"}); break;
    }
  }
};

// ---------------------------------------------------------------------------------------- Decoding

/**
 * Pop and decode everything in the session's outbound queue
 */
inline vector<net::Envelope> drain(Session& session) {
  vector<net::Envelope> out;
  while (auto buffer = session.pop_outbound()) {
    auto envelope = net::decode_envelope(net::to_span_bytes(*buffer));
    if (envelope)
      out.push_back(std::move(*envelope));
  }
  return out;
}

inline vector<rpc::Event> drain_events(Session& session) {
  vector<rpc::Event> out;
  for (auto& envelope : drain(session))
    if (auto* event = std::get_if<rpc::Event>(&envelope))
      out.push_back(std::move(*event));
  return out;
}

inline vector<string> event_names(const vector<rpc::Event>& events) {
  vector<string> out;
  for (const auto& event : events)
    out.push_back(event.name);
  return out;
}

inline net::BufferType encode_request(uint64_t request_id, string operation,
                                      rpc::Value::List args = {}, rpc::Value::Dict kwargs = {}) {
  net::BufferType buffer;
  net::encode(buffer,
              rpc::Request{request_id, std::move(operation), std::move(args), std::move(kwargs)});
  return buffer;
}

/**
 * Poll `predicate` until it holds, or `timeout` passes
 */
template <typename Predicate>
bool wait_for(Predicate predicate,
              std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() > deadline)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }
  return true;
}

} // namespace haul::test
