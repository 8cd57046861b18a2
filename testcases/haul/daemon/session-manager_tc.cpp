#include "stdinc.hpp"

#include "haul/daemon/event-manager.hpp"
#include "haul/daemon/session-manager.hpp"

#include "haul/test-helpers.hpp"

#include <catch2/catch_all.hpp>

namespace haul::tests {

using namespace std::chrono_literals;
using test::FakeConnection;

CATCH_TEST_CASE("FilterMatches", "[session]") {
  CATCH_REQUIRE(filter_matches("*", "job.added"));
  CATCH_REQUIRE(filter_matches("job.*", "job.added"));
  CATCH_REQUIRE(filter_matches("job.added", "job.added"));
  CATCH_REQUIRE(!filter_matches("job.*", "job."));
  CATCH_REQUIRE(!filter_matches("job.*", "jobs.added"));
  CATCH_REQUIRE(!filter_matches("job.added", "job.added.more"));
  CATCH_REQUIRE(!filter_matches("job", "job.added"));
}

CATCH_TEST_CASE("Session", "[session]") {
  auto connection = make_shared<FakeConnection>();
  Session session{1, connection, 2};

  CATCH_SECTION("a new session is connecting, unauthenticated") {
    CATCH_REQUIRE(session.state() == SessionState::CONNECTING);
    CATCH_REQUIRE(session.level() == AuthLevel::NONE);
    CATCH_REQUIRE(session.is_open());
    CATCH_REQUIRE(session.connection() == connection);
  }

  CATCH_SECTION("events are dropped when the queue is full, responses are not") {
    CATCH_REQUIRE(session.enqueue_event(net::make_send_buffer("e1")));
    CATCH_REQUIRE(session.enqueue_event(net::make_send_buffer("e2")));
    CATCH_REQUIRE(!session.enqueue_event(net::make_send_buffer("e3")));
    CATCH_REQUIRE(session.dropped_events() == 1);
    CATCH_REQUIRE(session.enqueue_response(net::make_send_buffer("r1")));
    CATCH_REQUIRE(session.outbound_size() == 3);

    CATCH_REQUIRE(session.pop_outbound() == net::make_send_buffer("e1"));
    CATCH_REQUIRE(session.pop_outbound() == net::make_send_buffer("e2"));
    CATCH_REQUIRE(session.pop_outbound() == net::make_send_buffer("r1"));
    CATCH_REQUIRE(!session.pop_outbound().has_value());
  }

  CATCH_SECTION("filters") {
    CATCH_REQUIRE(session.add_filter("job.*"));
    CATCH_REQUIRE(!session.add_filter("job.*"));
    CATCH_REQUIRE(session.is_interested("job.status"));
    CATCH_REQUIRE(!session.is_interested("label.changed"));
    CATCH_REQUIRE(session.remove_filter("job.*"));
    CATCH_REQUIRE(!session.remove_filter("job.*"));
    CATCH_REQUIRE(!session.has_filters());
  }
}

CATCH_TEST_CASE("SessionManager", "[session-manager]") {
  EventManager events;
  SessionManager::Config config;
  config.id_grace_period = 10s;
  config.idle_timeout = 60s;
  config.max_login_attempts = 3;
  SessionManager sessions{config, events, test::make_auth_table()};

  CATCH_SECTION("ids start at 1, and are not reused during the grace period") {
    auto connection = make_shared<FakeConnection>();
    auto s1 = sessions.open(connection);
    auto s2 = sessions.open(connection);
    CATCH_REQUIRE(s1->id() == 1);
    CATCH_REQUIRE(s2->id() == 2);
    CATCH_REQUIRE(sessions.size() == 2);

    sessions.close(*s1, "test");
    CATCH_REQUIRE(sessions.size() == 1);
    CATCH_REQUIRE(sessions.find(1) == nullptr);

    sessions.release_ids(Session::clock_type::now());
    CATCH_REQUIRE(sessions.open(connection)->id() == 3);

    sessions.release_ids(Session::clock_type::now() + 11s);
    CATCH_REQUIRE(sessions.open(connection)->id() == 1);
    CATCH_REQUIRE(sessions.open(connection)->id() == 4);
  }

  CATCH_SECTION("login") {
    auto connection = make_shared<FakeConnection>();
    auto session = sessions.open(connection);
    sessions.handshake_complete(*session);
    CATCH_REQUIRE(session->state() == SessionState::AUTHENTICATING);

    auto level = sessions.authenticate(*session, {"user", "u-secret"});
    CATCH_REQUIRE(level.has_value());
    CATCH_REQUIRE(*level == AuthLevel::STANDARD);
    CATCH_REQUIRE(session->level() == AuthLevel::STANDARD);
    CATCH_REQUIRE(session->username() == "user");
    CATCH_REQUIRE(session->state() == SessionState::AUTHENTICATED);
  }

  CATCH_SECTION("a failed login leaves the level alone, and the session open") {
    auto connection = make_shared<FakeConnection>();
    auto session = sessions.open(connection);
    sessions.handshake_complete(*session);
    CATCH_REQUIRE(sessions.authenticate(*session, {"admin", "a-secret"}).has_value());

    auto level = sessions.authenticate(*session, {"admin", "wrong"});
    CATCH_REQUIRE(!level.has_value());
    CATCH_REQUIRE(level.error().kind() == rpc::FaultKind::AUTH_ERROR);
    CATCH_REQUIRE(session->level() == AuthLevel::ADMIN);
    CATCH_REQUIRE(session->is_open());
    CATCH_REQUIRE(connection->disconnects().empty());
  }

  CATCH_SECTION("too many failed logins close the session") {
    auto connection = make_shared<FakeConnection>();
    auto session = sessions.open(connection);
    sessions.handshake_complete(*session);
    for (int i = 0; i < 3; ++i)
      CATCH_REQUIRE(!sessions.authenticate(*session, {"user", "nope"}).has_value());
    CATCH_REQUIRE(session->state() == SessionState::CLOSED);
    CATCH_REQUIRE(connection->disconnects().size() == 1);
  }

  CATCH_SECTION("a closed session stays closed when a login races its close") {
    auto connection = make_shared<FakeConnection>();
    for (int i = 0; i < 2000; ++i) {
      auto session = sessions.open(connection);
      sessions.handshake_complete(*session);

      std::atomic<bool> go{false};
      std::thread login{[&]() {
        while (!go)
          std::this_thread::yield();
        if (sessions.authenticate(*session, {"user", "u-secret"}).has_value())
          events.subscribe(session, "job.*");
      }};
      std::thread closer{[&]() {
        while (!go)
          std::this_thread::yield();
        sessions.close(*session, "race");
      }};
      go = true;
      login.join();
      closer.join();

      CATCH_REQUIRE(session->state() == SessionState::CLOSED);
      CATCH_REQUIRE(!session->is_open());
      CATCH_REQUIRE(!session->has_filters());
    }
    CATCH_REQUIRE(sessions.size() == 0);
    CATCH_REQUIRE(events.subscriber_count() == 0);

    auto closed = sessions.open(connection);
    sessions.close(*closed, "done");
    auto late = sessions.authenticate(*closed, {"user", "u-secret"});
    CATCH_REQUIRE(!late.has_value());
    CATCH_REQUIRE(late.error().kind() == rpc::FaultKind::AUTH_ERROR);
    CATCH_REQUIRE(closed->level() == AuthLevel::NONE);
  }

  CATCH_SECTION("close discards the queue and subscriptions, once") {
    auto connection = make_shared<FakeConnection>();
    auto session = sessions.open(connection);
    CATCH_REQUIRE(events.subscribe(session, "job.*"));
    CATCH_REQUIRE(events.subscriber_count() == 1);
    CATCH_REQUIRE(session->enqueue_response(net::make_send_buffer("pending")));

    sessions.close(*session, "bye");
    sessions.close(*session, "bye again");

    CATCH_REQUIRE(session->state() == SessionState::CLOSED);
    CATCH_REQUIRE(!session->is_open());
    CATCH_REQUIRE(session->outbound_size() == 0);
    CATCH_REQUIRE(!session->has_filters());
    CATCH_REQUIRE(events.subscriber_count() == 0);
    CATCH_REQUIRE(connection->disconnects() == vector<string>{"bye"});

    CATCH_REQUIRE(!session->enqueue_response(net::make_send_buffer("late")));
    CATCH_REQUIRE(!events.subscribe(session, "job.*"));
  }

  CATCH_SECTION("idle sessions expire") {
    auto connection = make_shared<FakeConnection>();
    auto idle = sessions.open(connection);
    auto busy = sessions.open(connection);
    const auto later = Session::clock_type::now() + 61s;
    busy->touch(later);

    CATCH_REQUIRE(sessions.expire_idle(later) == 1);
    CATCH_REQUIRE(!idle->is_open());
    CATCH_REQUIRE(busy->is_open());
  }

  CATCH_SECTION("stopping closes every session") {
    auto connection = make_shared<FakeConnection>();
    sessions.open(connection);
    sessions.open(connection);
    ComponentRegistry registry;
    shared_ptr<SessionManager> manager{&sessions, [](SessionManager*) {}};
    CATCH_REQUIRE(!registry.add(manager));
    CATCH_REQUIRE(!registry.start());
    CATCH_REQUIRE(!registry.stop());
    CATCH_REQUIRE(sessions.size() == 0);
    CATCH_REQUIRE(connection->disconnects().size() == 2);
  }
}

} // namespace haul::tests
