#pragma once

#include "auth.hpp"

#include "haul/net/buffer.hpp"
#include "haul/utils/base-include.hpp"

#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <set>

namespace haul {

using SessionId = uint64_t;

enum class SessionState : uint8_t {
  CONNECTING,     //!< Transport handshake in progress
  AUTHENTICATING, //!< Waiting for credentials
  AUTHENTICATED,
  CLOSING,
  CLOSED
};

constexpr std::string_view str(SessionState state) {
#define CASE(x)                                                                                    \
  case SessionState::x:                                                                            \
    return #x
  switch (state) {
    CASE(CONNECTING);
    CASE(AUTHENTICATING);
    CASE(AUTHENTICATED);
    CASE(CLOSING);
    CASE(CLOSED);
  }
#undef CASE
  return "<unknown state>";
}

/**
 * @brief Does `filter` select `event_name`?
 *
 * A filter is either an exact event name, `*`, or a prefix pattern like `job.*`.
 */
bool filter_matches(std::string_view filter, std::string_view event_name);

// -------------------------------------------------------------------------------------- Connection

/**
 * @brief The transport end of a session.
 */
class Connection {
public:
  virtual ~Connection() = default;

  /**
   * @brief The session's outbound queue has messages waiting.
   * @note Must be threadsafe, and must not block.
   */
  virtual void notify_outbound() = 0;

  /**
   * @brief Close the underlying connection.
   * @note Must be threadsafe, and idempotent.
   */
  virtual void disconnect(std::string_view reason) = 0;
};

// ----------------------------------------------------------------------------------------- Session

/**
 * @brief Per-connection state: identity, authorization level, event filters and the
 * outbound message queue.
 *
 * Sessions are owned by the `SessionManager`; everything else holds them by `shared_ptr`
 * for the duration of a call, or `weak_ptr` otherwise. The state and level only change
 * through the `SessionManager`.
 */
class Session {
public:
  using clock_type = std::chrono::steady_clock;

private:
  mutable std::mutex padlock_;
  const SessionId id_;
  const std::weak_ptr<Connection> connection_;
  const std::size_t queue_capacity_;

  SessionState state_{SessionState::CONNECTING};
  AuthLevel level_{AuthLevel::NONE};
  string username_{};
  std::set<string, std::less<>> filters_{};
  std::deque<net::BufferType> outbound_{};
  uint64_t dropped_events_{0};
  uint32_t auth_failures_{0};
  clock_type::time_point last_activity_;

  friend class SessionManager;

  bool set_state_(SessionState state);
  bool begin_closing_(); //!< false if already closing
  bool set_authenticated_(string username, AuthLevel level); //!< false if closing
  uint32_t record_auth_failure_();
  void discard_outbound_();

public:
  Session(SessionId id, std::weak_ptr<Connection> connection, std::size_t queue_capacity);
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  SessionId id() const { return id_; }
  SessionState state() const;
  AuthLevel level() const;
  string username() const;

  /** @brief True until the session starts closing */
  bool is_open() const;

  shared_ptr<Connection> connection() const { return connection_.lock(); }

  // @{ Idle tracking
  void touch(clock_type::time_point now = clock_type::now());
  clock_type::time_point last_activity() const;
  // @}

  // @{ Event filters
  /** @return false if the filter was already present */
  bool add_filter(string filter);
  /** @return false if the filter was not present */
  bool remove_filter(std::string_view filter);
  void clear_filters();
  bool has_filters() const;
  vector<string> filters() const;
  bool is_interested(std::string_view event_name) const;
  // @}

  // @{ Outbound queue
  /**
   * @brief Queue an encoded event.
   * @return false if the event was dropped, because the queue is full or the session
   *         is closing.
   */
  bool enqueue_event(net::BufferType&& buffer);

  /**
   * @brief Queue an encoded response. Responses are never dropped for capacity.
   * @return false iff the session is closing.
   */
  bool enqueue_response(net::BufferType&& buffer);

  std::optional<net::BufferType> pop_outbound();
  std::size_t outbound_size() const;
  std::size_t queue_capacity() const { return queue_capacity_; }
  uint64_t dropped_events() const;
  // @}
};

} // namespace haul
