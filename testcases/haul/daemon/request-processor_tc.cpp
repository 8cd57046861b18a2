#include "stdinc.hpp"

#include "haul/daemon/request-processor.hpp"
#include "haul/daemon/session-manager.hpp"

#include "haul/test-helpers.hpp"

#include <catch2/catch_all.hpp>

#include <boost/asio/thread_pool.hpp>

namespace haul::tests {

using namespace std::chrono_literals;

using rpc::Fault;
using rpc::FaultKind;
using rpc::Response;
using rpc::Value;
using test::TestClient;

namespace {
  using Result = expected<Value, Fault>;

  vector<Response> drain_responses(Session& session) {
    vector<Response> out;
    for (auto& envelope : test::drain(session))
      if (auto* response = std::get_if<Response>(&envelope))
        out.push_back(std::move(*response));
    return out;
  }
} // namespace

CATCH_TEST_CASE("RequestProcessor", "[request-processor]") {
  EventManager events;
  SessionManager sessions{{}, events, test::make_auth_table()};
  RpcDispatcher dispatcher;

  std::atomic<bool> release{false};
  CATCH_REQUIRE(dispatcher.register_operation(
      "test.echo", [](CallContext& context) -> Result { return Value{context.args()}; },
      AuthLevel::NONE));
  CATCH_REQUIRE(dispatcher.register_operation(
      "test.slow",
      [&release](CallContext&) -> Result {
        while (!release)
          std::this_thread::sleep_for(1ms);
        return Value{"late"};
      },
      AuthLevel::NONE));

  boost::asio::thread_pool pool{4};

  CATCH_SECTION("responses land in the session's queue") {
    RequestProcessor processor{sessions, dispatcher, pool.get_executor(), {}};
    TestClient client{sessions, std::nullopt};

    for (uint64_t id = 1; id <= 10; ++id) {
      const auto frame = test::encode_request(id, "test.echo", {int64_t(id)});
      CATCH_REQUIRE(processor.process(client.session, net::to_span_bytes(frame)));
    }
    CATCH_REQUIRE(test::wait_for([&]() { return client.session->outbound_size() == 10; }));

    auto responses = drain_responses(*client.session);
    CATCH_REQUIRE(responses.size() == 10);
    std::set<uint64_t> ids;
    for (const auto& response : responses) {
      CATCH_REQUIRE(response.ok());
      CATCH_REQUIRE(response.result == Value{Value::List{int64_t(response.request_id)}});
      ids.insert(response.request_id);
    }
    CATCH_REQUIRE(ids.size() == 10);
    CATCH_REQUIRE(client.connection->notified() >= 1);
    CATCH_REQUIRE(client.connection->disconnects().empty());

    pool.join();
  }

  CATCH_SECTION("faults are responses") {
    RequestProcessor processor{sessions, dispatcher, pool.get_executor(), {}};
    TestClient client{sessions, std::nullopt};

    const auto frame = test::encode_request(3, "test.missing");
    CATCH_REQUIRE(processor.process(client.session, net::to_span_bytes(frame)));
    CATCH_REQUIRE(test::wait_for([&]() { return client.session->outbound_size() == 1; }));

    auto responses = drain_responses(*client.session);
    CATCH_REQUIRE(responses.size() == 1);
    CATCH_REQUIRE(responses[0].request_id == 3);
    CATCH_REQUIRE(responses[0].fault.kind() == FaultKind::METHOD_NOT_FOUND);
    CATCH_REQUIRE(client.session->is_open());

    pool.join();
  }

  CATCH_SECTION("a slow call times out without holding up the others") {
    RequestProcessor processor{sessions, dispatcher, pool.get_executor(),
                               RequestProcessor::Config{50ms}};
    TestClient slow{sessions, std::nullopt};
    TestClient fast{sessions, std::nullopt};

    const auto slow_frame = test::encode_request(1, "test.slow");
    CATCH_REQUIRE(processor.process(slow.session, net::to_span_bytes(slow_frame)));
    const auto fast_frame = test::encode_request(2, "test.echo", {"quick"});
    CATCH_REQUIRE(processor.process(fast.session, net::to_span_bytes(fast_frame)));

    CATCH_REQUIRE(test::wait_for([&]() { return fast.session->outbound_size() == 1; }));
    auto fast_responses = drain_responses(*fast.session);
    CATCH_REQUIRE(fast_responses.size() == 1);
    CATCH_REQUIRE(fast_responses[0].ok());

    CATCH_REQUIRE(test::wait_for([&]() { return slow.session->outbound_size() == 1; }));
    auto slow_responses = drain_responses(*slow.session);
    CATCH_REQUIRE(slow_responses.size() == 1);
    CATCH_REQUIRE(slow_responses[0].request_id == 1);
    CATCH_REQUIRE(slow_responses[0].fault.kind() == FaultKind::TIMEOUT);
    CATCH_REQUIRE(processor.timeouts() == 1);

    // The late result is discarded
    release = true;
    pool.join();
    CATCH_REQUIRE(slow.session->outbound_size() == 0);
    CATCH_REQUIRE(slow.session->is_open());
  }

  CATCH_SECTION("closing a session mid-call discards the result") {
    RequestProcessor processor{sessions, dispatcher, pool.get_executor(), {}};
    TestClient leaving{sessions, std::nullopt};
    TestClient staying{sessions, std::nullopt};

    const auto slow_frame = test::encode_request(1, "test.slow");
    CATCH_REQUIRE(processor.process(leaving.session, net::to_span_bytes(slow_frame)));
    sessions.close(*leaving.session, "bye");

    const auto echo_frame = test::encode_request(2, "test.echo", {"still here"});
    CATCH_REQUIRE(processor.process(staying.session, net::to_span_bytes(echo_frame)));
    CATCH_REQUIRE(test::wait_for([&]() { return staying.session->outbound_size() == 1; }));

    release = true;
    pool.join();
    CATCH_REQUIRE(leaving.session->outbound_size() == 0);
    CATCH_REQUIRE(drain_responses(*staying.session).size() == 1);
  }

  CATCH_SECTION("protocol errors close the session") {
    RequestProcessor processor{sessions, dispatcher, pool.get_executor(), {}};
    TestClient client{sessions, std::nullopt};

    CATCH_SECTION("malformed frame") {
      const std::array<std::byte, 3> garbage{std::byte{0xff}, std::byte{0x01}, std::byte{0x02}};
      CATCH_REQUIRE(!processor.process(client.session, garbage));
    }

    CATCH_SECTION("a response is not a request") {
      net::BufferType frame;
      CATCH_REQUIRE(net::encode(frame, Response::success(1, Value{true})));
      CATCH_REQUIRE(!processor.process(client.session, net::to_span_bytes(frame)));
    }

    CATCH_REQUIRE(!client.session->is_open());
    CATCH_REQUIRE(client.connection->disconnects().size() == 1);
    CATCH_REQUIRE(sessions.find(client.session->id()) == nullptr);

    pool.join();
  }
}

} // namespace haul::tests
