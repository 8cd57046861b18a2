#pragma once

#include "auth.hpp"
#include "component.hpp"
#include "session.hpp"

#include "haul/rpc/fault.hpp"
#include "haul/utils/base-include.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <set>

namespace haul {

class EventManager;

// ---------------------------------------------------------------------------------- SessionManager

/**
 * @brief Owns every live session.
 *
 * Session ids start at 1. A closed session's id is only handed out again after
 * `id_grace_period` has elapsed, lowest id first. `on_update` closes sessions that have
 * been idle for longer than `idle_timeout` and releases ids whose grace period is over.
 */
class SessionManager final : public Component {
public:
  using clock_type = Session::clock_type;

  struct Config {
    std::chrono::milliseconds idle_timeout = std::chrono::minutes{10}; //!< zero disables
    std::chrono::milliseconds id_grace_period = std::chrono::seconds{30};
    std::size_t queue_capacity = 1024;
    uint32_t max_login_attempts = 3;
  };

private:
  mutable std::mutex padlock_;
  const Config config_;
  EventManager& events_;
  shared_ptr<const AuthTable> auth_;

  std::map<SessionId, shared_ptr<Session>> sessions_;
  std::map<SessionId, clock_type::time_point> released_; //!< In their grace period
  std::set<SessionId> reusable_;
  SessionId next_id_{1};

  SessionId allocate_id_(); //!< Call with padlock_ held

protected:
  void on_update() override;
  void on_stop() override;

public:
  SessionManager(Config config, EventManager& events, shared_ptr<const AuthTable> auth);
  ~SessionManager() override;

  const Config& config() const { return config_; }

  /** @brief Replace the auth table, ie., after the auth file was edited */
  void set_auth_table(shared_ptr<const AuthTable> auth);

  /** @brief A new connection; the session starts in the CONNECTING state */
  shared_ptr<Session> open(std::weak_ptr<Connection> connection);

  /** @brief The transport handshake is complete; CONNECTING => AUTHENTICATING */
  void handshake_complete(Session& session);

  /**
   * @brief Check `credentials` and, if accepted, set the session's level.
   *
   * A rejected attempt returns an `AUTH_ERROR` fault and leaves the session's level
   * alone. After `max_login_attempts` rejections the session is closed.
   */
  expected<AuthLevel, rpc::Fault> authenticate(Session& session, const Credentials& credentials);

  /**
   * @brief Close the session: discard its outbound queue, drop its event subscriptions,
   * disconnect the transport, and put its id into the grace period.
   * @note Idempotent, and safe to call from anywhere.
   */
  void close(Session& session, std::string_view reason);

  shared_ptr<Session> find(SessionId id) const;
  vector<shared_ptr<Session>> sessions() const;
  std::size_t size() const;

  /** @return The number of sessions closed for being idle since before `now - idle_timeout` */
  std::size_t expire_idle(clock_type::time_point now);

  /** @brief Make ids whose grace period ended before `now` available again */
  void release_ids(clock_type::time_point now);
};

} // namespace haul
