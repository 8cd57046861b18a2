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

namespace {
  /**
   * The daemon's registries, wired together the way the daemon wires them
   */
  struct CoreFixture {
    EventManager events;
    SessionManager sessions{{}, events, test::make_auth_table()};
    RpcDispatcher dispatcher;
    PluginManager plugins{dispatcher, events};
    MemoryJobEngine jobs;
    std::atomic<int> shutdown_requests{0};

    CoreFixture() {
      auto registered = register_core_operations(
          CoreServices{dispatcher, sessions, events, plugins, jobs, "9.9.9",
                       [this]() { ++shutdown_requests; }});
      if (!registered)
        throw std::runtime_error(string{registered.error().message()});
      connect_job_events(jobs, events);
      plugins.register_factory(string{plugins::LabelPlugin::k_name}, plugins::make_label_plugin);
    }

    Response call(TestClient& client, uint64_t request_id, string operation,
                  Value::List args = {}) {
      return dispatcher.dispatch(client.session,
                                 Request{request_id, std::move(operation), std::move(args), {}});
    }
  };
} // namespace

CATCH_TEST_CASE("Scenarios", "[scenarios]") {
  CoreFixture core;

  CATCH_SECTION("an admin adds a job") {
    TestClient admin{core.sessions, AuthLevel::ADMIN};
    const auto response =
        core.call(admin, 17, "job.add", {"https://example.com/big.iso", "big.iso"});
    CATCH_REQUIRE(response.ok());
    CATCH_REQUIRE(response.request_id == 17);
    CATCH_REQUIRE(response.result.find("id") != nullptr);
    CATCH_REQUIRE(response.result.find("id")->as_int() == 1);
    CATCH_REQUIRE(response.result.find("source")->as_string() == "https://example.com/big.iso");
    CATCH_REQUIRE(response.result.find("destination")->as_string() == "big.iso");
    CATCH_REQUIRE(response.result.find("state")->as_string() == "Queued");
    CATCH_REQUIRE(core.jobs.size() == 1);
  }

  CATCH_SECTION("two subscribers each see one status change") {
    TestClient admin{core.sessions, AuthLevel::ADMIN};
    TestClient first{core.sessions, AuthLevel::READ_ONLY};
    TestClient second{core.sessions, AuthLevel::READ_ONLY};

    CATCH_REQUIRE(core.call(first, 1, "daemon.set_event_interest", {"job.status"}).ok());
    CATCH_REQUIRE(
        core.call(second, 1, "daemon.set_event_interest", {Value{Value::List{"job.status"}}}).ok());

    CATCH_REQUIRE(core.call(admin, 1, "job.add", {"https://example.com/a"}).ok());
    CATCH_REQUIRE(core.call(admin, 2, "job.pause", {1}).ok());

    for (auto* client : {&first, &second}) {
      const auto events = test::drain_events(*client->session);
      CATCH_REQUIRE(test::event_names(events) == vector<string>{"job.status"});
      CATCH_REQUIRE(events[0].payload.find("state")->as_string() == "Paused");
    }
    CATCH_REQUIRE(test::drain_events(*admin.session).empty());

    CATCH_SECTION("and stop seeing them once uninterested") {
      CATCH_REQUIRE(core.call(first, 2, "daemon.remove_event_interest", {"job.status"}).ok());
      CATCH_REQUIRE(core.call(admin, 3, "job.resume", {1}).ok());
      CATCH_REQUIRE(test::drain_events(*first.session).empty());
      CATCH_REQUIRE(test::drain_events(*second.session).size() == 1);
    }
  }

  CATCH_SECTION("unloading a plugin removes its operations") {
    TestClient admin{core.sessions, AuthLevel::ADMIN};
    CATCH_REQUIRE(core.call(admin, 1, "job.add", {"https://example.com/a"}).ok());

    const auto enabled = core.call(admin, 2, "daemon.enable_plugin", {"label"});
    CATCH_REQUIRE(enabled.ok());
    CATCH_REQUIRE(enabled.result.find("version")->as_string() == "1.0");
    CATCH_REQUIRE(core.call(admin, 3, "label.set", {1, "linux"}).ok());

    const auto disabled = core.call(admin, 4, "daemon.disable_plugin", {"label"});
    CATCH_REQUIRE(disabled.result == Value{true});

    const auto response = core.call(admin, 5, "label.set", {1, "linux"});
    CATCH_REQUIRE(response.request_id == 5);
    CATCH_REQUIRE(response.fault.kind() == FaultKind::METHOD_NOT_FOUND);
  }

  CATCH_SECTION("a read-only session cannot remove jobs") {
    TestClient admin{core.sessions, AuthLevel::ADMIN};
    TestClient reader{core.sessions, AuthLevel::READ_ONLY};
    CATCH_REQUIRE(core.call(admin, 1, "job.add", {"https://example.com/a"}).ok());

    const auto response = core.call(reader, 2, "job.remove", {1});
    CATCH_REQUIRE(response.request_id == 2);
    CATCH_REQUIRE(response.fault.kind() == FaultKind::AUTH_ERROR);
    CATCH_REQUIRE(core.jobs.execute_count(JobVerb::REMOVE) == 0);
    CATCH_REQUIRE(core.jobs.size() == 1);
    CATCH_REQUIRE(reader.session->is_open());
  }

  CATCH_SECTION("login through the dispatcher") {
    TestClient client{core.sessions, std::nullopt};
    CATCH_REQUIRE(core.call(client, 1, "job.list").fault.kind() == FaultKind::AUTH_ERROR);

    const auto bad = core.call(client, 2, "daemon.login", {"user", "wrong"});
    CATCH_REQUIRE(bad.fault.kind() == FaultKind::AUTH_ERROR);

    const auto good = core.call(client, 3, "daemon.login", {"user", "u-secret"});
    CATCH_REQUIRE(good.ok());
    CATCH_REQUIRE(good.result.find("level")->as_int() == int(AuthLevel::STANDARD));
    CATCH_REQUIRE(core.call(client, 4, "job.list").result == Value{Value::List{}});
  }

  CATCH_SECTION("daemon operations") {
    TestClient reader{core.sessions, AuthLevel::READ_ONLY};
    TestClient admin{core.sessions, AuthLevel::ADMIN};

    const auto info = core.call(reader, 1, "daemon.info");
    CATCH_REQUIRE(info.result.find("version")->as_string() == "9.9.9");

    const auto methods = core.call(reader, 2, "daemon.get_method_list");
    CATCH_REQUIRE(methods.ok());
    CATCH_REQUIRE(std::ranges::count(methods.result.as_list(), Value{"job.add"}) == 1);

    CATCH_REQUIRE(core.call(reader, 3, "daemon.shutdown").fault.kind() == FaultKind::AUTH_ERROR);
    CATCH_REQUIRE(core.shutdown_requests == 0);
    CATCH_REQUIRE(core.call(admin, 4, "daemon.shutdown").ok());
    CATCH_REQUIRE(core.shutdown_requests == 1);

    CATCH_REQUIRE(core.call(admin, 5, "daemon.enable_plugin", {"nope"}).fault.kind()
                  == FaultKind::PLUGIN_LOAD_ERROR);
    CATCH_REQUIRE(core.call(reader, 6, "daemon.plugins").result == Value{Value::List{}});
  }
}

} // namespace haul::tests
