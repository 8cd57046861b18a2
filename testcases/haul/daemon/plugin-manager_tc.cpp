#include "stdinc.hpp"

#include "haul/daemon/plugin-manager.hpp"
#include "haul/daemon/session-manager.hpp"

#include "haul/test-helpers.hpp"

#include <catch2/catch_all.hpp>

namespace haul::tests {

using rpc::Event;
using rpc::Fault;
using rpc::FaultKind;
using rpc::Request;
using rpc::Value;
using test::TestClient;

namespace {
  using Result = expected<Value, Fault>;

  void require(const expected<void, Fault>& result) {
    if (!result)
      throw std::runtime_error(string{result.error().message()});
  }

  // Registers some operations and a handler, then optionally fails
  class ScriptedPlugin final : public Plugin {
  private:
    string name_;
    vector<string> operations_;
    bool fail_enable_;
    vector<string>* journal_;

  public:
    std::atomic<int> events_seen{0};

    ScriptedPlugin(string name, vector<string> operations, bool fail_enable,
                   vector<string>* journal = nullptr)
        : name_{std::move(name)}, operations_{std::move(operations)}, fail_enable_{fail_enable},
          journal_{journal} {}

    std::string_view name() const override { return name_; }
    std::string_view version() const override { return "1.2"; }

    void enable(PluginApi& api) override {
      for (const auto& operation : operations_)
        require(api.register_operation(
            operation, [](CallContext&) -> Result { return Value{"scripted"}; },
            AuthLevel::READ_ONLY));
      api.subscribe_handler("job.*", [this](const Event&) { ++events_seen; });
      if (fail_enable_)
        throw std::runtime_error("enable failed on purpose");
    }

    void disable() override {
      if (journal_ != nullptr)
        journal_->push_back("disable:" + name_);
    }
  };

  // Throws something that is not a std::exception from `enable` or `disable`
  class UnrulyPlugin final : public Plugin {
  private:
    bool throw_on_enable_;
    bool throw_std_;

  public:
    UnrulyPlugin(bool throw_on_enable, bool throw_std)
        : throw_on_enable_{throw_on_enable}, throw_std_{throw_std} {}

    std::string_view name() const override { return "unruly"; }
    std::string_view version() const override { return "0"; }

    void enable(PluginApi& api) override {
      require(api.register_operation(
          "unruly.op", [](CallContext&) -> Result { return Value{}; }, AuthLevel::NONE));
      api.subscribe_handler("job.added", [](const Event&) {});
      if (throw_on_enable_)
        throw 42;
    }

    void disable() override {
      if (throw_on_enable_)
        return;
      if (throw_std_)
        throw std::logic_error("disable went wrong");
      throw 42;
    }
  };

  // An operation that blocks until released; records its own destruction
  class BlockingPlugin final : public Plugin {
  private:
    std::atomic<bool>& entered_;
    std::atomic<bool>& release_;
    std::atomic<bool>& destroyed_;

  public:
    BlockingPlugin(std::atomic<bool>& entered, std::atomic<bool>& release,
                   std::atomic<bool>& destroyed)
        : entered_{entered}, release_{release}, destroyed_{destroyed} {}
    ~BlockingPlugin() override { destroyed_ = true; }

    std::string_view name() const override { return "blocking"; }
    std::string_view version() const override { return "1"; }

    void enable(PluginApi& api) override {
      require(api.register_operation(
          "blocking.wait",
          [this](CallContext&) -> Result {
            entered_ = true;
            while (!release_)
              std::this_thread::yield();
            return Value{"released"};
          },
          AuthLevel::NONE));
    }
    void disable() override {}
  };
} // namespace

CATCH_TEST_CASE("PluginManager", "[plugin-manager]") {
  EventManager events;
  SessionManager sessions{{}, events, test::make_auth_table()};
  RpcDispatcher dispatcher;
  PluginManager plugins{dispatcher, events};

  CATCH_REQUIRE(dispatcher.register_operation(
      "daemon.info", [](CallContext&) -> Result { return Value{"core"}; }, AuthLevel::NONE));

  vector<string> journal;
  plugins.register_factory("good", [&journal]() -> unique_ptr<Plugin> {
    return make_unique<ScriptedPlugin>("good", vector<string>{"good.a", "good.b"}, false,
                                       &journal);
  });
  plugins.register_factory("other", [&journal]() -> unique_ptr<Plugin> {
    return make_unique<ScriptedPlugin>("other", vector<string>{"other.a"}, false, &journal);
  });
  plugins.register_factory("throws", []() -> unique_ptr<Plugin> {
    return make_unique<ScriptedPlugin>("throws", vector<string>{"throws.a"}, true);
  });
  plugins.register_factory("clashes", []() -> unique_ptr<Plugin> {
    return make_unique<ScriptedPlugin>("clashes", vector<string>{"clashes.a", "daemon.info"},
                                       false);
  });

  plugins.register_factory("enable-throws-int", []() -> unique_ptr<Plugin> {
    return make_unique<UnrulyPlugin>(true, false);
  });
  plugins.register_factory("disable-throws-std", []() -> unique_ptr<Plugin> {
    return make_unique<UnrulyPlugin>(false, true);
  });
  plugins.register_factory("disable-throws-int", []() -> unique_ptr<Plugin> {
    return make_unique<UnrulyPlugin>(false, false);
  });
  plugins.register_factory("factory-throws-int", []() -> unique_ptr<Plugin> { throw 7; });

  TestClient client{sessions, AuthLevel::READ_ONLY};
  auto call = [&](string operation) {
    return dispatcher.dispatch(client.session, Request{1, std::move(operation), {}, {}});
  };

  CATCH_SECTION("load and unload") {
    auto info = plugins.load("good");
    CATCH_REQUIRE(info.has_value());
    CATCH_REQUIRE(info->name == "good");
    CATCH_REQUIRE(info->version == "1.2");
    CATCH_REQUIRE(info->enabled);
    CATCH_REQUIRE(plugins.is_loaded("good"));
    CATCH_REQUIRE(plugins.plugins().size() == 1);

    CATCH_REQUIRE(call("good.a").result == Value{"scripted"});
    CATCH_REQUIRE(dispatcher.describe("good.b")->owner_tag == "good");
    CATCH_REQUIRE(events.handler_count() == 1);

    CATCH_REQUIRE(plugins.unload("good"));
    CATCH_REQUIRE(!plugins.is_loaded("good"));
    CATCH_REQUIRE(call("good.a").fault.kind() == FaultKind::METHOD_NOT_FOUND);
    CATCH_REQUIRE(events.handler_count() == 0);
    CATCH_REQUIRE(journal == vector<string>{"disable:good"});

    CATCH_REQUIRE(!plugins.unload("good"));
  }

  CATCH_SECTION("loading the same name twice fails") {
    CATCH_REQUIRE(plugins.load("good").has_value());
    auto again = plugins.load("good");
    CATCH_REQUIRE(!again.has_value());
    CATCH_REQUIRE(again.error().kind() == FaultKind::PLUGIN_LOAD_ERROR);
  }

  CATCH_SECTION("a failed enable leaves the registries exactly as they were") {
    CATCH_REQUIRE(plugins.load("other").has_value());
    const auto operations_before = dispatcher.snapshot();
    const auto handlers_before = events.handler_snapshot();

    auto thrown = plugins.load("throws");
    CATCH_REQUIRE(!thrown.has_value());
    CATCH_REQUIRE(thrown.error().kind() == FaultKind::PLUGIN_LOAD_ERROR);
    CATCH_REQUIRE(thrown.error().details() == "enable failed on purpose");

    auto clashed = plugins.load("clashes");
    CATCH_REQUIRE(!clashed.has_value());
    CATCH_REQUIRE(clashed.error().kind() == FaultKind::PLUGIN_LOAD_ERROR);

    CATCH_REQUIRE(dispatcher.snapshot() == operations_before);
    CATCH_REQUIRE(events.handler_snapshot() == handlers_before);
    CATCH_REQUIRE(!plugins.is_loaded("throws"));
    CATCH_REQUIRE(!plugins.is_loaded("clashes"));
    CATCH_REQUIRE(call("daemon.info").result == Value{"core"});
  }

  CATCH_SECTION("a non-standard exception from enable is rolled back") {
    const auto operations_before = dispatcher.snapshot();
    const auto handlers_before = events.handler_snapshot();

    auto thrown = plugins.load("unruly", "enable-throws-int");
    CATCH_REQUIRE(!thrown.has_value());
    CATCH_REQUIRE(thrown.error().kind() == FaultKind::PLUGIN_LOAD_ERROR);
    CATCH_REQUIRE(!plugins.is_loaded("unruly"));
    CATCH_REQUIRE(!dispatcher.describe("unruly.op").has_value());
    CATCH_REQUIRE(dispatcher.snapshot() == operations_before);
    CATCH_REQUIRE(events.handler_snapshot() == handlers_before);

    auto factory = plugins.load("broken", "factory-throws-int");
    CATCH_REQUIRE(!factory.has_value());
    CATCH_REQUIRE(factory.error().kind() == FaultKind::PLUGIN_LOAD_ERROR);
    CATCH_REQUIRE(!plugins.is_loaded("broken"));
  }

  CATCH_SECTION("a throwing disable still unloads") {
    for (const auto source : {"disable-throws-std", "disable-throws-int"}) {
      CATCH_REQUIRE(plugins.load("unruly", source).has_value());
      CATCH_REQUIRE(call("unruly.op").fault.ok());
      CATCH_REQUIRE(events.handler_count() == 1);

      CATCH_REQUIRE(plugins.unload("unruly"));
      CATCH_REQUIRE(!plugins.is_loaded("unruly"));
      CATCH_REQUIRE(call("unruly.op").fault.kind() == FaultKind::METHOD_NOT_FOUND);
      CATCH_REQUIRE(events.handler_count() == 0);
    }
  }

  CATCH_SECTION("the empty name belongs to built-in operations") {
    auto unnamed = plugins.load("", "good");
    CATCH_REQUIRE(!unnamed.has_value());
    CATCH_REQUIRE(unnamed.error().kind() == FaultKind::PLUGIN_LOAD_ERROR);
    CATCH_REQUIRE(!dispatcher.describe("good.a").has_value());

    CATCH_REQUIRE(!plugins.unload(""));
    CATCH_REQUIRE(call("daemon.info").result == Value{"core"});
    CATCH_REQUIRE(dispatcher.describe("daemon.info")->owner_tag == "");
  }

  CATCH_SECTION("unknown sources") {
    auto unknown = plugins.load("nope");
    CATCH_REQUIRE(!unknown.has_value());
    CATCH_REQUIRE(unknown.error().kind() == FaultKind::PLUGIN_LOAD_ERROR);

    auto missing = plugins.load("missing", "/nonexistent/libhaul-missing.so");
    CATCH_REQUIRE(!missing.has_value());
    CATCH_REQUIRE(missing.error().kind() == FaultKind::PLUGIN_LOAD_ERROR);
  }

  CATCH_SECTION("registrations are tagged with the loaded name") {
    auto loaded = plugins.load("alias", "good");
    CATCH_REQUIRE(loaded.has_value());
    CATCH_REQUIRE(loaded->source == "good");
    CATCH_REQUIRE(dispatcher.describe("good.a")->owner_tag == "alias");
    CATCH_REQUIRE(events.handler_snapshot()
                  == vector<EventManager::HandlerInfo>{{"job.*", "alias"}});
  }

  CATCH_SECTION("stopping unloads everything, most recent first") {
    CATCH_REQUIRE(plugins.load("good").has_value());
    CATCH_REQUIRE(plugins.load("other").has_value());
    plugins.unload_all();
    CATCH_REQUIRE(journal == vector<string>{"disable:other", "disable:good"});
    CATCH_REQUIRE(plugins.plugins().empty());
    CATCH_REQUIRE(dispatcher.operation_names() == vector<string>{"daemon.info"});
  }

  CATCH_SECTION("a call in flight keeps an unloaded plugin alive") {
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    std::atomic<bool> destroyed{false};
    plugins.register_factory("blocking", [&]() -> unique_ptr<Plugin> {
      return make_unique<BlockingPlugin>(entered, release, destroyed);
    });
    CATCH_REQUIRE(plugins.load("blocking").has_value());

    rpc::Response response;
    std::thread caller{[&]() { response = call("blocking.wait"); }};
    CATCH_REQUIRE(test::wait_for([&entered]() { return entered.load(); }));

    CATCH_REQUIRE(plugins.unload("blocking"));
    CATCH_REQUIRE(call("blocking.wait").fault.kind() == FaultKind::METHOD_NOT_FOUND);
    CATCH_REQUIRE(!destroyed);

    release = true;
    caller.join();
    CATCH_REQUIRE(response.result == Value{"released"});
    CATCH_REQUIRE(destroyed);
  }

#ifdef HAUL_SAMPLE_PLUGIN_PATH
  CATCH_SECTION("shared object plugins") {
    auto info = plugins.load("sample", HAUL_SAMPLE_PLUGIN_PATH);
    CATCH_REQUIRE(info.has_value());
    CATCH_REQUIRE(info->version == "0.1");

    const auto echoed =
        dispatcher.dispatch(client.session, Request{2, "sample.echo", {"hello", 3}, {}});
    CATCH_REQUIRE(echoed.result == Value{Value::List{"hello", 3}});

    events.publish(Event::make("job.added", Value{}));
    CATCH_REQUIRE(call("sample.job_events").result == Value{1});

    CATCH_REQUIRE(plugins.unload("sample"));
    CATCH_REQUIRE(call("sample.echo").fault.kind() == FaultKind::METHOD_NOT_FOUND);

    // ...and it can come back
    CATCH_REQUIRE(plugins.load("sample", HAUL_SAMPLE_PLUGIN_PATH).has_value());
    CATCH_REQUIRE(call("sample.job_events").result == Value{0});
  }
#endif
}

} // namespace haul::tests
