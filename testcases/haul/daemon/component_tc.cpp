#include "stdinc.hpp"

#include "haul/daemon/component.hpp"

#include <catch2/catch_all.hpp>

namespace haul::tests {

// Appends "<hook>:<name>" to a shared journal
class JournalComponent : public Component {
private:
  vector<string>& journal_;

public:
  bool fail_start = false;

  JournalComponent(string name, vector<string>& journal, vector<string> depends = {})
      : Component{std::move(name), std::move(depends)}, journal_{journal} {}

protected:
  void on_start() override {
    if (fail_start)
      throw std::runtime_error("refusing to start");
    journal_.push_back("start:" + name());
  }
  void on_stop() override { journal_.push_back("stop:" + name()); }
  void on_pause() override { journal_.push_back("pause:" + name()); }
  void on_resume() override { journal_.push_back("resume:" + name()); }
  void on_update() override { journal_.push_back("update:" + name()); }
  void on_shutdown() override { journal_.push_back("shutdown:" + name()); }
};

CATCH_TEST_CASE("ComponentRegistry", "[component]") {
  vector<string> journal;
  ComponentRegistry registry;

  auto web = make_shared<JournalComponent>("web", journal, vector<string>{"core"});
  auto core = make_shared<JournalComponent>("core", journal);
  CATCH_REQUIRE(!registry.add(web));
  CATCH_REQUIRE(!registry.add(core));

  CATCH_SECTION("names are unique") {
    CATCH_REQUIRE(registry.add(make_shared<JournalComponent>("core", journal))
                  == make_error_code(ecode::argument_error));
    CATCH_REQUIRE(registry.names() == vector<string>{"web", "core"});
    CATCH_REQUIRE(registry.get("core") == core);
    CATCH_REQUIRE(registry.get("nope") == nullptr);
  }

  CATCH_SECTION("dependencies start first, and stop last") {
    CATCH_REQUIRE(!registry.start());
    CATCH_REQUIRE(journal == vector<string>{"start:core", "start:web"});
    CATCH_REQUIRE(web->state() == ComponentState::STARTED);

    journal.clear();
    CATCH_REQUIRE(!registry.stop("core"));
    CATCH_REQUIRE(journal == vector<string>{"stop:web", "stop:core"});
    CATCH_REQUIRE(web->state() == ComponentState::STOPPED);
  }

  CATCH_SECTION("update only reaches started components") {
    CATCH_REQUIRE(!registry.start("core"));
    journal.clear();
    registry.update();
    CATCH_REQUIRE(journal == vector<string>{"update:core"});

    CATCH_REQUIRE(!registry.pause("core"));
    CATCH_REQUIRE(core->state() == ComponentState::PAUSED);
    journal.clear();
    registry.update();
    CATCH_REQUIRE(journal.empty());

    CATCH_REQUIRE(!registry.resume("core"));
    CATCH_REQUIRE(core->state() == ComponentState::STARTED);
  }

  CATCH_SECTION("a failing hook leaves the state alone") {
    auto flaky = make_shared<JournalComponent>("flaky", journal);
    flaky->fail_start = true;
    CATCH_REQUIRE(!registry.add(flaky));
    CATCH_REQUIRE(registry.start("flaky") == make_error_code(ecode::operation_failed));
    CATCH_REQUIRE(flaky->state() == ComponentState::STOPPED);
  }

  CATCH_SECTION("cycles and unknown dependencies are reported") {
    CATCH_REQUIRE(!registry.add(make_shared<JournalComponent>("a", journal, vector<string>{"b"})));
    CATCH_REQUIRE(!registry.add(make_shared<JournalComponent>("b", journal, vector<string>{"a"})));
    CATCH_REQUIRE(registry.start("a") == make_error_code(ecode::logic_error));

    CATCH_REQUIRE(!registry.add(make_shared<JournalComponent>("c", journal, vector<string>{"x"})));
    CATCH_REQUIRE(registry.start("c") == make_error_code(ecode::argument_error));
  }

  CATCH_SECTION("remove stops the component first") {
    CATCH_REQUIRE(!registry.start());
    journal.clear();
    CATCH_REQUIRE(!registry.remove("web"));
    CATCH_REQUIRE(journal == vector<string>{"stop:web"});
    CATCH_REQUIRE(registry.names() == vector<string>{"core"});
  }

  CATCH_SECTION("shutdown stops everything, then runs the shutdown hooks") {
    CATCH_REQUIRE(!registry.start());
    journal.clear();
    registry.shutdown();
    CATCH_REQUIRE(journal
                  == vector<string>{"stop:web", "stop:core", "shutdown:core", "shutdown:web"});
  }
}

} // namespace haul::tests
