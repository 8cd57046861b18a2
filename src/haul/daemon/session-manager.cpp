
#include "session-manager.hpp"

#include "event-manager.hpp"

namespace haul {

using rpc::Fault;
using rpc::FaultKind;

// ------------------------------------------------------------------------------------ Construction

SessionManager::SessionManager(Config config, EventManager& events,
                               shared_ptr<const AuthTable> auth)
    : Component{"SessionManager"}, config_{std::move(config)}, events_{events},
      auth_{std::move(auth)} {
  if (auth_ == nullptr)
    auth_ = make_shared<const AuthTable>();
}

SessionManager::~SessionManager() = default;

void SessionManager::set_auth_table(shared_ptr<const AuthTable> auth) {
  std::lock_guard lock{padlock_};
  auth_ = (auth == nullptr) ? make_shared<const AuthTable>() : std::move(auth);
}

// -------------------------------------------------------------------------------------------- Open

SessionId SessionManager::allocate_id_() {
  if (!reusable_.empty()) {
    const auto id = *reusable_.begin();
    reusable_.erase(reusable_.begin());
    return id;
  }
  return next_id_++;
}

shared_ptr<Session> SessionManager::open(std::weak_ptr<Connection> connection) {
  std::lock_guard lock{padlock_};
  const auto id = allocate_id_();
  auto session = make_shared<Session>(id, std::move(connection), config_.queue_capacity);
  sessions_.insert({id, session});
  TRACE("session {} opened", id);
  return session;
}

void SessionManager::handshake_complete(Session& session) {
  std::lock_guard lock{session.padlock_};
  if (session.state_ == SessionState::CONNECTING)
    session.state_ = SessionState::AUTHENTICATING;
}

// ------------------------------------------------------------------------------------ Authenticate

expected<AuthLevel, Fault> SessionManager::authenticate(Session& session,
                                                        const Credentials& credentials) {
  if (!session.is_open())
    return make_unexpected(Fault{FaultKind::AUTH_ERROR, "session is closing"});

  shared_ptr<const AuthTable> auth;
  {
    std::lock_guard lock{padlock_};
    auth = auth_;
  }

  if (const auto level = auth->check(credentials); level.has_value()) {
    if (!session.set_authenticated_(credentials.username, *level))
      return make_unexpected(Fault{FaultKind::AUTH_ERROR, "session is closing"});
    INFO("session {} authenticated as '{}', level {}", session.id(), credentials.username,
         str(*level));
    return *level;
  }

  const auto failures = session.record_auth_failure_();
  WARN("session {} failed to authenticate as '{}', attempt {}/{}", session.id(),
       credentials.username, failures, config_.max_login_attempts);
  if (failures >= config_.max_login_attempts) {
    close(session, "too many failed login attempts");
    return make_unexpected(Fault{FaultKind::AUTH_ERROR, "too many failed login attempts"});
  }
  return make_unexpected(Fault{FaultKind::AUTH_ERROR, "invalid username or password"});
}

// ------------------------------------------------------------------------------------------- Close

void SessionManager::close(Session& session, std::string_view reason) {
  if (!session.begin_closing_())
    return; // someone else is closing it

  session.discard_outbound_();
  events_.remove_session(session.id());

  {
    std::lock_guard lock{padlock_};
    auto ii = sessions_.find(session.id());
    if (ii != sessions_.end() && ii->second.get() == &session) {
      sessions_.erase(ii);
      released_.insert_or_assign(session.id(), clock_type::now() + config_.id_grace_period);
    }
  }

  session.set_state_(SessionState::CLOSED);
  INFO("session {} closed: {}", session.id(), reason);

  if (auto connection = session.connection())
    connection->disconnect(reason);
}

// ----------------------------------------------------------------------------------------- Lookups

shared_ptr<Session> SessionManager::find(SessionId id) const {
  std::lock_guard lock{padlock_};
  auto ii = sessions_.find(id);
  return (ii == sessions_.end()) ? nullptr : ii->second;
}

vector<shared_ptr<Session>> SessionManager::sessions() const {
  std::lock_guard lock{padlock_};
  vector<shared_ptr<Session>> out;
  out.reserve(sessions_.size());
  for (const auto& [id, session] : sessions_)
    out.push_back(session);
  return out;
}

std::size_t SessionManager::size() const {
  std::lock_guard lock{padlock_};
  return sessions_.size();
}

// ------------------------------------------------------------------------------------- Maintenance

std::size_t SessionManager::expire_idle(clock_type::time_point now) {
  if (config_.idle_timeout.count() <= 0)
    return 0;

  vector<shared_ptr<Session>> expired;
  for (auto& session : sessions())
    if (now - session->last_activity() > config_.idle_timeout)
      expired.push_back(std::move(session));

  for (auto& session : expired)
    close(*session, "idle timeout");
  return expired.size();
}

void SessionManager::release_ids(clock_type::time_point now) {
  std::lock_guard lock{padlock_};
  for (auto ii = released_.begin(); ii != released_.end();) {
    if (ii->second <= now) {
      reusable_.insert(ii->first);
      ii = released_.erase(ii);
    } else {
      ++ii;
    }
  }
}

void SessionManager::on_update() {
  const auto now = clock_type::now();
  expire_idle(now);
  release_ids(now);
}

void SessionManager::on_stop() {
  for (auto& session : sessions())
    close(*session, "daemon stopping");
}

} // namespace haul
