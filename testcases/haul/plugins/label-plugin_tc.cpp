#include "stdinc.hpp"

#include "haul/daemon/core-operations.hpp"
#include "haul/plugins/label-plugin.hpp"

#include "haul/test-helpers.hpp"

#include <catch2/catch_all.hpp>

namespace haul::tests {

using rpc::FaultKind;
using rpc::Request;
using rpc::Response;
using rpc::Value;
using test::TestClient;

CATCH_TEST_CASE("LabelPlugin", "[label-plugin]") {
  EventManager events;
  SessionManager sessions{{}, events, test::make_auth_table()};
  RpcDispatcher dispatcher;
  PluginManager plugins{dispatcher, events};
  MemoryJobEngine jobs;

  CATCH_REQUIRE(
      register_core_operations(CoreServices{dispatcher, sessions, events, plugins, jobs}));
  connect_job_events(jobs, events);
  plugins.register_factory(string{plugins::LabelPlugin::k_name}, plugins::make_label_plugin);
  CATCH_REQUIRE(plugins.load("label"));

  TestClient user{sessions, AuthLevel::STANDARD};
  TestClient reader{sessions, AuthLevel::READ_ONLY};

  uint64_t request_id = 0;
  auto call = [&](TestClient& client, string operation, Value::List args = {}) {
    return dispatcher.dispatch(client.session,
                               Request{++request_id, std::move(operation), std::move(args), {}});
  };

  CATCH_REQUIRE(call(user, "job.add", {"https://example.com/a"}).ok());
  CATCH_REQUIRE(call(user, "job.add", {"https://example.com/b"}).ok());

  CATCH_SECTION("set, get and list") {
    CATCH_REQUIRE(call(user, "label.set", {1, "  linux  "}).ok());
    CATCH_REQUIRE(call(user, "label.set", {2, "music"}).ok());

    CATCH_REQUIRE(call(reader, "label.get", {1}).result == Value{"linux"});
    CATCH_REQUIRE(call(reader, "label.get", {3}).result == Value{});
    CATCH_REQUIRE(call(reader, "label.list").result
                  == Value{Value::Dict{{"1", "linux"}, {"2", "music"}}});

    // An empty label removes it
    CATCH_REQUIRE(call(user, "label.set", {1, ""}).ok());
    CATCH_REQUIRE(call(reader, "label.list").result == Value{Value::Dict{{"2", "music"}}});
  }

  CATCH_SECTION("readers cannot set labels") {
    CATCH_REQUIRE(call(reader, "label.set", {1, "linux"}).fault.kind() == FaultKind::AUTH_ERROR);
    CATCH_REQUIRE(call(reader, "label.get", {1}).result == Value{});
  }

  CATCH_SECTION("labels are bounded") {
    const auto response = call(user, "label.set", {1, string(200, 'x')});
    CATCH_REQUIRE(response.fault.kind() == FaultKind::HANDLER_ERROR);
    CATCH_REQUIRE(call(user, "label.set", {1, string(128, 'x')}).ok());
  }

  CATCH_SECTION("bad arguments are handler errors") {
    CATCH_REQUIRE(call(user, "label.set", {"one", "linux"}).fault.kind()
                  == FaultKind::HANDLER_ERROR);
    CATCH_REQUIRE(call(user, "label.set", {1}).fault.kind() == FaultKind::HANDLER_ERROR);
  }

  CATCH_SECTION("changes are published") {
    CATCH_REQUIRE(call(reader, "daemon.set_event_interest", {"label.*"}).ok());
    CATCH_REQUIRE(call(user, "label.set", {2, "music"}).ok());

    const auto received = test::drain_events(*reader.session);
    CATCH_REQUIRE(test::event_names(received) == vector<string>{"label.changed"});
    CATCH_REQUIRE(received[0].payload
                  == Value{Value::Dict{{"id", int64_t(2)}, {"label", "music"}}});
  }

  CATCH_SECTION("removing a job forgets its label") {
    CATCH_REQUIRE(call(user, "label.set", {1, "linux"}).ok());
    CATCH_REQUIRE(call(user, "label.set", {2, "music"}).ok());

    TestClient admin{sessions, AuthLevel::ADMIN};
    CATCH_REQUIRE(call(admin, "job.remove", {1}).ok());
    CATCH_REQUIRE(call(reader, "label.list").result == Value{Value::Dict{{"2", "music"}}});
  }

  CATCH_SECTION("unloading forgets everything") {
    CATCH_REQUIRE(call(user, "label.set", {1, "linux"}).ok());
    CATCH_REQUIRE(plugins.unload("label"));
    CATCH_REQUIRE(call(reader, "label.get", {1}).fault.kind() == FaultKind::METHOD_NOT_FOUND);

    CATCH_REQUIRE(plugins.load("label"));
    CATCH_REQUIRE(call(reader, "label.get", {1}).result == Value{});
  }
}

} // namespace haul::tests
