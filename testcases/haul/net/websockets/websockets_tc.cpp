#include "stdinc.hpp"

#include "haul/daemon/daemon.hpp"
#include "haul/net/asio-execution-context.hpp"
#include "haul/net/rpc-client.hpp"

#include "haul/test-helpers.hpp"

#include <catch2/catch_all.hpp>

namespace haul::tests {

using namespace std::chrono_literals;

using rpc::Event;
using rpc::FaultKind;
using rpc::Response;
using rpc::Value;

namespace {
  DaemonConfig make_loopback_config() {
    DaemonConfig config;
    config.address = "127.0.0.1";
    config.port = 0;
    config.certificate_chain_file = HAUL_TEST_ASSETS_DIR "/test-certificate/server.crt";
    config.private_key_file = HAUL_TEST_ASSETS_DIR "/test-certificate/server.key";
    config.io_threads = 1;
    config.worker_threads = 2;
    config.update_interval = std::chrono::hours{1};
    config.plugins = {"label"};
    return config;
  }

  // --------------------------------------------------------------------------------- EventRecorder

  struct EventRecorder {
    std::mutex padlock;
    vector<Event> events;

    void operator()(Event event) {
      std::lock_guard lock{padlock};
      events.push_back(std::move(event));
    }

    vector<string> names() {
      std::lock_guard lock{padlock};
      return test::event_names(events);
    }
  };

  Response await(std::future<Response>&& future) {
    if (future.wait_for(5s) != std::future_status::ready)
      throw std::runtime_error("timed out waiting for a response");
    return future.get();
  }
} // namespace

CATCH_TEST_CASE("websockets-daemon", "[websockets]") {
  Daemon daemon{make_loopback_config(), test::make_auth_table()};
  CATCH_REQUIRE(!daemon.start());
  CATCH_REQUIRE(daemon.port() != 0);
  CATCH_REQUIRE(daemon.plugins().is_loaded("label"));

  net::AsioExecutionContext context{1};
  auto recorder = make_shared<EventRecorder>();
  auto client = make_shared<net::RpcClient>();
  client->set_event_callback([recorder](Event event) { (*recorder)(std::move(event)); });
  net::connect(client, context.io_context(), "127.0.0.1", daemon.port());
  context.run();

  auto connected = client->connected();
  CATCH_REQUIRE(connected.wait_for(5s) == std::future_status::ready);
  CATCH_REQUIRE(connected.get());
  CATCH_REQUIRE(test::wait_for([&daemon]() { return daemon.sessions().sessions().size() == 1; }));

  CATCH_SECTION("calls over TLS") {
    const auto info = await(client->call("daemon.info"));
    CATCH_REQUIRE(info.ok());
    CATCH_REQUIRE(info.result.find("version")->as_string() == k_daemon_version);

    const auto denied = await(client->call("job.add", {"https://example.com/a"}));
    CATCH_REQUIRE(denied.fault.kind() == FaultKind::AUTH_ERROR);

    const auto login = await(client->call("daemon.login", {"admin", "a-secret"}));
    CATCH_REQUIRE(login.ok());

    const auto added = await(client->call("job.add", {"https://example.com/a"}));
    CATCH_REQUIRE(added.ok());
    CATCH_REQUIRE(added.result.find("id")->as_int() == 1);

    const auto missing = await(client->call("no.such.operation"));
    CATCH_REQUIRE(missing.fault.kind() == FaultKind::METHOD_NOT_FOUND);
    CATCH_REQUIRE(client->outstanding() == 0);
  }

  CATCH_SECTION("events are pushed to interested clients") {
    CATCH_REQUIRE(await(client->call("daemon.login", {"user", "u-secret"})).ok());
    CATCH_REQUIRE(
        await(client->call("daemon.set_event_interest", {"job.added", "label.changed"})).ok());

    CATCH_REQUIRE(await(client->call("job.add", {"https://example.com/a"})).ok());
    CATCH_REQUIRE(await(client->call("job.pause", {1})).ok());
    CATCH_REQUIRE(await(client->call("label.set", {1, "linux"})).ok());

    CATCH_REQUIRE(test::wait_for([&recorder]() { return recorder->names().size() == 2; }));
    CATCH_REQUIRE(recorder->names() == vector<string>{"job.added", "label.changed"});
  }

  CATCH_SECTION("the daemon forgets closed connections") {
    client->close(1000, "done");
    CATCH_REQUIRE(
        test::wait_for([&daemon]() { return daemon.sessions().sessions().empty(); }));
  }

  client->close(1000, "done");
  context.stop();
  daemon.stop();
}

} // namespace haul::tests
