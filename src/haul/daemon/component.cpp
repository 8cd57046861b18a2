
#include "component.hpp"

#include "haul/utils/error-codes.hpp"

namespace haul {

template <typename F> static error_code run_hook_(Component& component, string_view hook, F&& f) {
  try {
    f();
  } catch (std::exception& e) {
    LOG_ERR("component '{}' failed to {}: {}", component.name(), hook, e.what());
    return make_error_code(ecode::operation_failed);
  }
  return {};
}

static bool contains_(const vector<string>& names, string_view name) {
  return std::find(cbegin(names), cend(names), name) != cend(names);
}

// ------------------------------------------------------------------------------------ Construction

ComponentRegistry::~ComponentRegistry() = default;

error_code ComponentRegistry::add(shared_ptr<Component> component) {
  if (component == nullptr)
    return make_error_code(ecode::argument_error);
  std::lock_guard lock{padlock_};
  if (find_(component->name()) != nullptr) {
    WARN("component '{}' is already registered", component->name());
    return make_error_code(ecode::argument_error);
  }
  TRACE("registered component '{}'", component->name());
  components_.push_back(std::move(component));
  return {};
}

error_code ComponentRegistry::remove(string_view name) {
  std::lock_guard lock{padlock_};
  auto component = find_(name);
  if (component == nullptr)
    return make_error_code(ecode::argument_error);
  vector<string> visiting;
  if (auto ec = stop_(*component, visiting))
    return ec;
  components_.erase(std::find(begin(components_), end(components_), component));
  return {};
}

shared_ptr<Component> ComponentRegistry::get(string_view name) const {
  std::lock_guard lock{padlock_};
  return find_(name);
}

vector<string> ComponentRegistry::names() const {
  std::lock_guard lock{padlock_};
  vector<string> out;
  out.reserve(components_.size());
  for (const auto& component : components_)
    out.push_back(component->name());
  return out;
}

shared_ptr<Component> ComponentRegistry::find_(string_view name) const {
  auto ii = std::find_if(cbegin(components_), cend(components_),
                         [name](const auto& component) { return component->name() == name; });
  return (ii == cend(components_)) ? nullptr : *ii;
}

// ------------------------------------------------------------------------------------------- Start

error_code ComponentRegistry::start_(Component& component, vector<string>& visiting) {
  if (component.state() != ComponentState::STOPPED)
    return {};
  if (contains_(visiting, component.name())) {
    LOG_ERR("dependency cycle through component '{}'", component.name());
    return make_error_code(ecode::logic_error);
  }
  visiting.push_back(component.name());

  for (const auto& dependency : component.depends()) {
    auto other = find_(dependency);
    if (other == nullptr) {
      LOG_ERR("component '{}' depends on unknown component '{}'", component.name(), dependency);
      return make_error_code(ecode::argument_error);
    }
    if (auto ec = start_(*other, visiting))
      return ec;
  }

  if (auto ec = run_hook_(component, "start", [&]() { component.on_start(); }))
    return ec;
  component.state_.store(ComponentState::STARTED, std::memory_order_release);
  TRACE("component '{}' started", component.name());
  return {};
}

error_code ComponentRegistry::start() {
  std::lock_guard lock{padlock_};
  for (auto& component : components_) {
    vector<string> visiting;
    if (auto ec = start_(*component, visiting))
      return ec;
  }
  return {};
}

error_code ComponentRegistry::start(string_view name) {
  std::lock_guard lock{padlock_};
  auto component = find_(name);
  if (component == nullptr)
    return make_error_code(ecode::argument_error);
  vector<string> visiting;
  return start_(*component, visiting);
}

// -------------------------------------------------------------------------------------------- Stop

error_code ComponentRegistry::stop_(Component& component, vector<string>& visiting) {
  if (component.state() == ComponentState::STOPPED)
    return {};
  if (contains_(visiting, component.name()))
    return make_error_code(ecode::logic_error);
  visiting.push_back(component.name());

  // Dependents go first
  for (auto& other : components_)
    if (contains_(other->depends(), component.name()))
      if (auto ec = stop_(*other, visiting))
        return ec;

  if (auto ec = run_hook_(component, "stop", [&]() { component.on_stop(); }))
    return ec;
  component.state_.store(ComponentState::STOPPED, std::memory_order_release);
  TRACE("component '{}' stopped", component.name());
  return {};
}

error_code ComponentRegistry::stop() {
  std::lock_guard lock{padlock_};
  error_code first_error{};
  for (auto ii = components_.rbegin(); ii != components_.rend(); ++ii) {
    vector<string> visiting;
    auto ec = stop_(**ii, visiting);
    if (ec && !first_error)
      first_error = ec;
  }
  return first_error;
}

error_code ComponentRegistry::stop(string_view name) {
  std::lock_guard lock{padlock_};
  auto component = find_(name);
  if (component == nullptr)
    return make_error_code(ecode::argument_error);
  vector<string> visiting;
  return stop_(*component, visiting);
}

// ------------------------------------------------------------------------------------ Pause/Resume

error_code ComponentRegistry::pause_(Component& component) {
  if (component.state() != ComponentState::STARTED)
    return {};
  if (auto ec = run_hook_(component, "pause", [&]() { component.on_pause(); }))
    return ec;
  component.state_.store(ComponentState::PAUSED, std::memory_order_release);
  return {};
}

error_code ComponentRegistry::resume_(Component& component) {
  if (component.state() != ComponentState::PAUSED)
    return {};
  if (auto ec = run_hook_(component, "resume", [&]() { component.on_resume(); }))
    return ec;
  component.state_.store(ComponentState::STARTED, std::memory_order_release);
  return {};
}

error_code ComponentRegistry::pause() {
  std::lock_guard lock{padlock_};
  for (auto& component : components_)
    if (auto ec = pause_(*component))
      return ec;
  return {};
}

error_code ComponentRegistry::pause(string_view name) {
  std::lock_guard lock{padlock_};
  auto component = find_(name);
  return (component == nullptr) ? make_error_code(ecode::argument_error) : pause_(*component);
}

error_code ComponentRegistry::resume() {
  std::lock_guard lock{padlock_};
  for (auto& component : components_)
    if (auto ec = resume_(*component))
      return ec;
  return {};
}

error_code ComponentRegistry::resume(string_view name) {
  std::lock_guard lock{padlock_};
  auto component = find_(name);
  return (component == nullptr) ? make_error_code(ecode::argument_error) : resume_(*component);
}

// ------------------------------------------------------------------------------------------ Update

void ComponentRegistry::update() {
  std::lock_guard lock{padlock_};
  for (auto& component : components_)
    if (component->state() == ComponentState::STARTED)
      run_hook_(*component, "update", [&]() { component->on_update(); });
}

void ComponentRegistry::shutdown() {
  if (auto ec = stop())
    WARN("some components failed to stop: {}", ec.message());
  std::lock_guard lock{padlock_};
  for (auto ii = components_.rbegin(); ii != components_.rend(); ++ii)
    run_hook_(**ii, "shutdown", [&]() { (*ii)->on_shutdown(); });
}

} // namespace haul
