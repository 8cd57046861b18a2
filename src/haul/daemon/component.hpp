#pragma once

#include "haul/utils/base-include.hpp"

#include <atomic>
#include <mutex>

namespace haul {

enum class ComponentState : uint8_t { STOPPED, STARTED, PAUSED };

constexpr std::string_view str(ComponentState state) {
  switch (state) {
  case ComponentState::STOPPED: return "Stopped";
  case ComponentState::STARTED: return "Started";
  case ComponentState::PAUSED: return "Paused";
  }
  return "<unknown state>";
}

// --------------------------------------------------------------------------------------- Component

/**
 * @brief A long lived part of the daemon, with a lifecycle driven by `ComponentRegistry`.
 *
 * Subclasses override the `on_*` hooks. A hook reports failure by throwing; the registry
 * logs it and leaves the component in its previous state. Hooks must not call back into
 * the registry.
 */
class Component {
private:
  const string name_;
  const vector<string> depends_;
  std::atomic<ComponentState> state_{ComponentState::STOPPED};

  friend class ComponentRegistry;

protected:
  virtual void on_start() {}
  virtual void on_stop() {}
  virtual void on_pause() {}
  virtual void on_resume() {}
  virtual void on_update() {}
  virtual void on_shutdown() {}

public:
  explicit Component(string name, vector<string> depends = {})
      : name_{std::move(name)}, depends_{std::move(depends)} {}
  Component(const Component&) = delete;
  Component& operator=(const Component&) = delete;
  virtual ~Component() = default;

  const string& name() const { return name_; }
  const vector<string>& depends() const { return depends_; }
  ComponentState state() const { return state_.load(std::memory_order_acquire); }
};

// ------------------------------------------------------------------------------- ComponentRegistry

/**
 * @brief Holds the daemon's components, and moves them through their lifecycle.
 *
 * `start` starts dependencies first; `stop` stops dependents first. Operations that take
 * no name apply to every component, in registration order. The error codes returned are
 * `ecode::argument_error` for unknown or duplicate names, and `ecode::operation_failed`
 * when a hook throws.
 */
class ComponentRegistry {
private:
  mutable std::mutex padlock_;
  vector<shared_ptr<Component>> components_;

  shared_ptr<Component> find_(std::string_view name) const;
  error_code start_(Component& component, vector<string>& visiting);
  error_code stop_(Component& component, vector<string>& visiting);
  error_code pause_(Component& component);
  error_code resume_(Component& component);

public:
  ComponentRegistry() = default;
  ComponentRegistry(const ComponentRegistry&) = delete;
  ComponentRegistry& operator=(const ComponentRegistry&) = delete;
  ~ComponentRegistry();

  error_code add(shared_ptr<Component> component);

  /** @brief Stops the component first */
  error_code remove(std::string_view name);

  shared_ptr<Component> get(std::string_view name) const;
  vector<string> names() const;

  error_code start();
  error_code start(std::string_view name);
  error_code stop();
  error_code stop(std::string_view name);
  error_code pause();
  error_code pause(std::string_view name);
  error_code resume();
  error_code resume(std::string_view name);

  /** @brief Calls `on_update` for every started component */
  void update();

  /** @brief Stops everything, then calls `on_shutdown` on each component */
  void shutdown();
};

} // namespace haul
