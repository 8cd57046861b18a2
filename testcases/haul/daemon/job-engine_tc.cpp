#include "stdinc.hpp"

#include "haul/daemon/job-engine.hpp"

#include <catch2/catch_all.hpp>

namespace haul::tests {

using rpc::FaultKind;
using rpc::Value;

CATCH_TEST_CASE("MemoryJobEngine", "[job-engine]") {
  MemoryJobEngine engine{50};
  vector<std::pair<string, Value>> changes;
  engine.on_status_change([&changes](std::string_view name, Value payload) {
    changes.emplace_back(string{name}, std::move(payload));
  });

  ComponentRegistry registry;
  shared_ptr<MemoryJobEngine> component{&engine, [](MemoryJobEngine*) {}};
  CATCH_REQUIRE(!registry.add(component));
  CATCH_REQUIRE(!registry.start());

  CATCH_SECTION("add") {
    auto job = engine.execute({JobVerb::ADD, 0, "http://example.com/files/a.iso", ""});
    CATCH_REQUIRE(job.has_value());
    CATCH_REQUIRE(job->find("id")->as_int() == 1);
    CATCH_REQUIRE(job->find("destination")->as_string() == "a.iso");
    CATCH_REQUIRE(job->find("state")->as_string() == "Queued");
    CATCH_REQUIRE(changes.size() == 1);
    CATCH_REQUIRE(changes[0].first == "job.added");
    CATCH_REQUIRE(engine.size() == 1);
    CATCH_REQUIRE(engine.execute_count(JobVerb::ADD) == 1);

    auto empty = engine.execute({JobVerb::ADD, 0, "", ""});
    CATCH_REQUIRE(!empty.has_value());
    CATCH_REQUIRE(empty.error().kind() == FaultKind::HANDLER_ERROR);
  }

  CATCH_SECTION("progress") {
    CATCH_REQUIRE(engine.execute({JobVerb::ADD, 0, "a", "b"}).has_value());
    changes.clear();

    registry.update(); // Queued => Active
    registry.update(); // 50%
    registry.update(); // Finished
    CATCH_REQUIRE(changes.size() == 3);
    CATCH_REQUIRE(changes.back().first == "job.status");
    CATCH_REQUIRE(changes.back().second.find("state")->as_string() == "Finished");
    CATCH_REQUIRE(changes.back().second.find("progress")->as_int() == 100);

    changes.clear();
    registry.update();
    CATCH_REQUIRE(changes.empty());
  }

  CATCH_SECTION("pause and resume") {
    CATCH_REQUIRE(engine.execute({JobVerb::ADD, 0, "a", "b"}).has_value());
    changes.clear();

    CATCH_REQUIRE(engine.execute({JobVerb::PAUSE, 1}).has_value());
    CATCH_REQUIRE(engine.execute({JobVerb::PAUSE, 1}).has_value()); // no change, no event
    CATCH_REQUIRE(changes.size() == 1);

    registry.update();
    CATCH_REQUIRE(changes.size() == 1); // paused jobs make no progress

    auto resumed = engine.execute({JobVerb::RESUME, 1});
    CATCH_REQUIRE(resumed->find("state")->as_string() == "Queued");
    CATCH_REQUIRE(changes.size() == 2);
  }

  CATCH_SECTION("remove") {
    CATCH_REQUIRE(engine.execute({JobVerb::ADD, 0, "a", "b"}).has_value());
    CATCH_REQUIRE(engine.execute({JobVerb::REMOVE, 1}).has_value());
    CATCH_REQUIRE(changes.back().first == "job.removed");
    CATCH_REQUIRE(changes.back().second == Value{Value::Dict{{"id", 1}}});
    CATCH_REQUIRE(engine.size() == 0);

    auto missing = engine.execute({JobVerb::STATUS, 1});
    CATCH_REQUIRE(!missing.has_value());
    CATCH_REQUIRE(missing.error().message() == "no job 1");
  }

  CATCH_SECTION("list") {
    CATCH_REQUIRE(engine.execute({JobVerb::ADD, 0, "a", ""}).has_value());
    CATCH_REQUIRE(engine.execute({JobVerb::ADD, 0, "b", ""}).has_value());
    auto list = engine.execute({JobVerb::LIST});
    CATCH_REQUIRE(list->as_list().size() == 2);
  }
}

} // namespace haul::tests
