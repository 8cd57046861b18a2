#include "stdinc.hpp"

#include "haul/daemon/rpc-dispatcher.hpp"
#include "haul/daemon/session-manager.hpp"

#include "haul/test-helpers.hpp"

#include <catch2/catch_all.hpp>

namespace haul::tests {

using rpc::Fault;
using rpc::FaultKind;
using rpc::Request;
using rpc::Value;
using test::TestClient;

static expected<Value, Fault> echo(CallContext& context) { return Value{context.args()}; }

CATCH_TEST_CASE("RpcDispatcher", "[rpc-dispatcher]") {
  EventManager events;
  SessionManager sessions{{}, events, test::make_auth_table()};
  RpcDispatcher dispatcher;

  CATCH_REQUIRE(dispatcher.register_operation("test.echo", echo, AuthLevel::READ_ONLY));

  CATCH_SECTION("dispatch") {
    TestClient client{sessions, AuthLevel::READ_ONLY};
    const auto response =
        dispatcher.dispatch(client.session, Request{9, "test.echo", {1, "two"}, {}});
    CATCH_REQUIRE(response.ok());
    CATCH_REQUIRE(response.request_id == 9);
    CATCH_REQUIRE(response.result == Value{Value::List{1, "two"}});
  }

  CATCH_SECTION("unknown operations") {
    TestClient client{sessions, AuthLevel::ADMIN};
    const auto response = dispatcher.dispatch(client.session, Request{1, "test.nope", {}, {}});
    CATCH_REQUIRE(response.fault.kind() == FaultKind::METHOD_NOT_FOUND);
    CATCH_REQUIRE(response.request_id == 1);
  }

  CATCH_SECTION("the handler is not called without the level") {
    int calls = 0;
    CATCH_REQUIRE(dispatcher.register_operation(
        "test.admin",
        [&calls](CallContext&) -> expected<Value, Fault> {
          ++calls;
          return Value{true};
        },
        AuthLevel::ADMIN));

    TestClient anonymous{sessions, std::nullopt};
    TestClient user{sessions, AuthLevel::STANDARD};
    TestClient admin{sessions, AuthLevel::ADMIN};

    CATCH_REQUIRE(dispatcher.dispatch(anonymous.session, Request{1, "test.admin", {}, {}})
                      .fault.kind()
                  == FaultKind::AUTH_ERROR);
    CATCH_REQUIRE(dispatcher.dispatch(user.session, Request{2, "test.admin", {}, {}})
                      .fault.kind()
                  == FaultKind::AUTH_ERROR);
    CATCH_REQUIRE(calls == 0);
    CATCH_REQUIRE(dispatcher.dispatch(admin.session, Request{3, "test.admin", {}, {}}).ok());
    CATCH_REQUIRE(calls == 1);
  }

  CATCH_SECTION("an operation without a level cannot be called") {
    CATCH_REQUIRE(dispatcher.register_operation("test.locked", echo, std::nullopt));
    TestClient admin{sessions, AuthLevel::ADMIN};
    CATCH_REQUIRE(dispatcher.dispatch(admin.session, Request{1, "test.locked", {}, {}})
                      .fault.kind()
                  == FaultKind::AUTH_ERROR);
  }

  CATCH_SECTION("handler failures become faults") {
    CATCH_REQUIRE(dispatcher.register_operation(
        "test.throws",
        [](CallContext&) -> expected<Value, Fault> { throw std::runtime_error("disk full"); },
        AuthLevel::NONE));
    CATCH_REQUIRE(dispatcher.register_operation(
        "test.faults",
        [](CallContext&) -> expected<Value, Fault> {
          return make_unexpected(Fault{FaultKind::HANDLER_ERROR, "no job 7"});
        },
        AuthLevel::NONE));
    CATCH_REQUIRE(dispatcher.register_operation(
        "test.needs_arg",
        [](CallContext& context) -> expected<Value, Fault> {
          return Value{context.arg(0, "job_id").as_int()};
        },
        AuthLevel::NONE));

    TestClient client{sessions, std::nullopt};

    const auto thrown = dispatcher.dispatch(client.session, Request{1, "test.throws", {}, {}});
    CATCH_REQUIRE(thrown.fault.kind() == FaultKind::HANDLER_ERROR);
    CATCH_REQUIRE(thrown.fault.details() == "disk full");

    const auto faulted = dispatcher.dispatch(client.session, Request{2, "test.faults", {}, {}});
    CATCH_REQUIRE(faulted.fault == Fault{FaultKind::HANDLER_ERROR, "no job 7"});

    CATCH_REQUIRE(dispatcher.dispatch(client.session, Request{3, "test.needs_arg", {}, {}})
                      .fault.kind()
                  == FaultKind::HANDLER_ERROR);
    CATCH_REQUIRE(dispatcher.dispatch(client.session, Request{4, "test.needs_arg", {"x"}, {}})
                      .fault.kind()
                  == FaultKind::HANDLER_ERROR);
    const auto by_name = dispatcher.dispatch(
        client.session, Request{5, "test.needs_arg", {}, Value::Dict{{"job_id", 12}}});
    CATCH_REQUIRE(by_name.result == Value{12});
  }

  CATCH_SECTION("registration") {
    auto duplicate = dispatcher.register_operation("test.echo", echo, AuthLevel::NONE, "plugin");
    CATCH_REQUIRE(!duplicate);
    CATCH_REQUIRE(duplicate.error().kind() == FaultKind::ALREADY_EXISTS);
    CATCH_REQUIRE(dispatcher.describe("test.echo")
                  == OperationInfo{"test.echo", AuthLevel::READ_ONLY, ""});

    auto unnamed = dispatcher.register_operation("", echo, AuthLevel::NONE);
    CATCH_REQUIRE(!unnamed);
    CATCH_REQUIRE(unnamed.error().kind() == FaultKind::BAD_REGISTRATION);
    auto no_handler = dispatcher.register_operation("test.null", nullptr, AuthLevel::NONE);
    CATCH_REQUIRE(!no_handler);
    CATCH_REQUIRE(no_handler.error().kind() == FaultKind::BAD_REGISTRATION);
    CATCH_REQUIRE(!dispatcher.describe("test.null").has_value());
  }

  CATCH_SECTION("unregister by owner") {
    CATCH_REQUIRE(dispatcher.register_operation("p.a", echo, AuthLevel::NONE, "p"));
    CATCH_REQUIRE(dispatcher.register_operation("p.b", echo, AuthLevel::ADMIN, "p"));
    CATCH_REQUIRE(dispatcher.register_operation("q.a", echo, AuthLevel::NONE, "q"));

    CATCH_REQUIRE(dispatcher.operation_names(AuthLevel::NONE)
                  == vector<string>{"p.a", "q.a"});
    CATCH_REQUIRE(dispatcher.unregister_all("p") == 2);
    CATCH_REQUIRE(dispatcher.operation_names() == vector<string>{"q.a", "test.echo"});
    CATCH_REQUIRE(dispatcher.unregister_all("p") == 0);

    // Re-registration after unregistering is allowed
    CATCH_REQUIRE(dispatcher.register_operation("p.a", echo, AuthLevel::NONE, "p"));
  }

  CATCH_SECTION("a handler being unregistered finishes its call") {
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    auto keep_alive = make_shared<int>(42);
    weak_ptr<int> watcher = keep_alive;

    CATCH_REQUIRE(dispatcher.register_operation(
        "slow.op",
        [&entered, &release](CallContext&) -> expected<Value, Fault> {
          entered = true;
          while (!release)
            std::this_thread::yield();
          return Value{"done"};
        },
        AuthLevel::NONE, "slow", keep_alive));
    keep_alive.reset();
    CATCH_REQUIRE(!watcher.expired());

    TestClient client{sessions, std::nullopt};
    rpc::Response response;
    std::thread caller{[&]() {
      response = dispatcher.dispatch(client.session, Request{1, "slow.op", {}, {}});
    }};
    CATCH_REQUIRE(test::wait_for([&entered]() { return entered.load(); }));

    CATCH_REQUIRE(dispatcher.unregister_all("slow") == 1);
    CATCH_REQUIRE(!dispatcher.contains("slow.op"));
    CATCH_REQUIRE(!watcher.expired()); // the call in flight holds it

    release = true;
    caller.join();
    CATCH_REQUIRE(response.ok());
    CATCH_REQUIRE(response.result == Value{"done"});
    CATCH_REQUIRE(watcher.expired());
  }

  CATCH_SECTION("concurrent registration and dispatch") {
    TestClient client{sessions, AuthLevel::ADMIN};
    std::atomic<bool> stop{false};
    std::atomic<int> unexpected_results{0};

    std::thread writer{[&]() {
      for (int i = 0; i < 200; ++i) {
        const auto name = format("churn.{}", i % 4);
        if (!dispatcher.register_operation(name, echo, AuthLevel::NONE, "churn"))
          ++unexpected_results;
        dispatcher.unregister_all("churn");
      }
      stop = true;
    }};

    std::thread reader{[&]() {
      uint64_t id = 0;
      while (!stop) {
        const auto response =
            dispatcher.dispatch(client.session, Request{++id, "churn.0", {1}, {}});
        // Either completely registered or not at all
        if (!response.ok() && response.fault.kind() != FaultKind::METHOD_NOT_FOUND)
          ++unexpected_results;
        if (response.ok() && response.result != Value{Value::List{1}})
          ++unexpected_results;
        if (!dispatcher.dispatch(client.session, Request{++id, "test.echo", {}, {}}).ok())
          ++unexpected_results;
      }
    }};

    writer.join();
    reader.join();
    CATCH_REQUIRE(unexpected_results == 0);
    CATCH_REQUIRE(dispatcher.operation_names() == vector<string>{"test.echo"});
  }
}

} // namespace haul::tests
