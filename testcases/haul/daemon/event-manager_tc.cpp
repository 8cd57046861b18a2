#include "stdinc.hpp"

#include "haul/daemon/event-manager.hpp"
#include "haul/daemon/session-manager.hpp"

#include "haul/test-helpers.hpp"

#include <catch2/catch_all.hpp>

namespace haul::tests {

using rpc::Event;
using rpc::Value;
using test::drain_events;
using test::event_names;
using test::TestClient;

CATCH_TEST_CASE("EventManager", "[event-manager]") {
  EventManager events;
  SessionManager::Config config;
  config.queue_capacity = 4;
  SessionManager sessions{config, events, test::make_auth_table()};

  CATCH_SECTION("fan-out follows each session's filters") {
    TestClient jobs{sessions, AuthLevel::READ_ONLY};
    TestClient labels{sessions, AuthLevel::READ_ONLY};
    TestClient everything{sessions, AuthLevel::READ_ONLY};
    TestClient nothing{sessions, AuthLevel::READ_ONLY};
    CATCH_REQUIRE(events.subscribe(jobs.session, "job.*"));
    CATCH_REQUIRE(events.subscribe(labels.session, "label.changed"));
    CATCH_REQUIRE(events.subscribe(everything.session, "*"));

    CATCH_REQUIRE(events.publish(Event::make("job.added", Value::Dict{{"id", 1}})) == 2);
    CATCH_REQUIRE(events.publish(Event::make("label.changed", Value{})) == 2);

    CATCH_REQUIRE(event_names(drain_events(*jobs.session)) == vector<string>{"job.added"});
    CATCH_REQUIRE(event_names(drain_events(*labels.session)) == vector<string>{"label.changed"});
    CATCH_REQUIRE(event_names(drain_events(*everything.session))
                  == vector<string>{"job.added", "label.changed"});
    CATCH_REQUIRE(nothing.session->outbound_size() == 0);
    CATCH_REQUIRE(jobs.connection->notified() == 1);
  }

  CATCH_SECTION("events arrive in publish order, even from many threads") {
    SessionManager::Config big;
    big.queue_capacity = 10000;
    SessionManager roomy{big, events, test::make_auth_table()};
    TestClient reader{roomy, AuthLevel::READ_ONLY};
    CATCH_REQUIRE(events.subscribe(reader.session, "count.*"));

    constexpr int k_threads = 4;
    constexpr int k_per_thread = 250;
    vector<std::thread> threads;
    for (int t = 0; t < k_threads; ++t)
      threads.emplace_back([&events, t]() {
        for (int i = 0; i < k_per_thread; ++i)
          events.publish(Event::make(format("count.{}", t), Value{i}));
      });
    for (auto& thread : threads)
      thread.join();

    const auto received = drain_events(*reader.session);
    CATCH_REQUIRE(received.size() == std::size_t(k_threads * k_per_thread));

    // Per publisher, the sequence is intact
    vector<int64_t> next(std::size_t(k_threads), 0);
    for (const auto& event : received) {
      const auto t = std::size_t(std::stoi(event.name.substr(6)));
      CATCH_REQUIRE(event.payload.as_int() == next[t]);
      ++next[t];
    }
  }

  CATCH_SECTION("a full queue drops events, and never blocks the publisher") {
    TestClient slow{sessions, AuthLevel::READ_ONLY};
    TestClient fast{sessions, AuthLevel::READ_ONLY};
    CATCH_REQUIRE(events.subscribe(slow.session, "*"));
    CATCH_REQUIRE(events.subscribe(fast.session, "*"));

    for (int i = 0; i < 6; ++i) {
      events.publish(Event::make("tick", Value{i}));
      test::drain(*fast.session);
    }
    CATCH_REQUIRE(slow.session->outbound_size() == 4);
    CATCH_REQUIRE(slow.session->dropped_events() == 2);
    CATCH_REQUIRE(fast.session->dropped_events() == 0);

    // The oldest events are the ones kept
    const auto kept = drain_events(*slow.session);
    CATCH_REQUIRE(kept.front().payload.as_int() == 0);
    CATCH_REQUIRE(kept.back().payload.as_int() == 3);
  }

  CATCH_SECTION("unsubscribe") {
    TestClient client{sessions, AuthLevel::READ_ONLY};
    CATCH_REQUIRE(events.subscribe(client.session, "job.*"));
    CATCH_REQUIRE(!events.subscribe(client.session, "job.*"));
    CATCH_REQUIRE(events.unsubscribe(*client.session, "job.*"));
    CATCH_REQUIRE(!events.unsubscribe(*client.session, "job.*"));
    CATCH_REQUIRE(events.subscriber_count() == 0);
    CATCH_REQUIRE(events.publish(Event::make("job.added", Value{})) == 0);
  }

  CATCH_SECTION("closed sessions receive nothing") {
    TestClient client{sessions, AuthLevel::READ_ONLY};
    CATCH_REQUIRE(events.subscribe(client.session, "*"));
    sessions.close(*client.session, "test");
    CATCH_REQUIRE(events.publish(Event::make("job.added", Value{})) == 0);
    CATCH_REQUIRE(client.session->outbound_size() == 0);
  }

  CATCH_SECTION("handlers") {
    vector<string> seen;
    events.subscribe_handler("job.*", [&seen](const Event& e) { seen.push_back(e.name); },
                             "label");
    events.subscribe_handler("job.removed",
                             [](const Event&) { throw std::runtime_error("handler failure"); },
                             "broken");
    CATCH_REQUIRE(events.handler_count() == 2);

    events.publish(Event::make("job.removed", Value::Dict{{"id", 3}}));
    events.publish(Event::make("label.changed", Value{}));
    CATCH_REQUIRE(seen == vector<string>{"job.removed"});

    CATCH_REQUIRE(events.handler_snapshot()
                  == vector<EventManager::HandlerInfo>{{"job.*", "label"},
                                                        {"job.removed", "broken"}});

    CATCH_REQUIRE(events.unsubscribe_all("label") == 1);
    CATCH_REQUIRE(events.unsubscribe_all("label") == 0);
    events.publish(Event::make("job.added", Value{}));
    CATCH_REQUIRE(seen.size() == 1);
  }

  CATCH_SECTION("handlers may run on an executor") {
    vector<thunk_type> queued;
    events.set_handler_executor([&queued](thunk_type&& thunk) { queued.push_back(thunk); });
    int calls = 0;
    events.subscribe_handler("*", [&calls](const Event&) { ++calls; }, "counter");
    events.publish(Event::make("job.added", Value{}));
    CATCH_REQUIRE(calls == 0);
    CATCH_REQUIRE(queued.size() == 1);
    queued.front()();
    CATCH_REQUIRE(calls == 1);
  }
}

} // namespace haul::tests
