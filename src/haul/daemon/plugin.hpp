#pragma once

#include "auth.hpp"
#include "event-manager.hpp"
#include "rpc-dispatcher.hpp"

#include "haul/rpc/message.hpp"
#include "haul/utils/base-include.hpp"

#include <optional>

/**
 * @brief Bumped whenever `haul::Plugin` or `haul::PluginApi` change layout.
 */
#define HAUL_PLUGIN_ABI_VERSION 1

namespace haul {

// --------------------------------------------------------------------------------------- PluginApi

/**
 * @brief What a plugin may do to the daemon while it is enabled.
 *
 * Everything registered through a `PluginApi` is tagged with the plugin's name, and is
 * removed, all together, when the plugin is unloaded or fails to enable.
 */
class PluginApi {
public:
  virtual ~PluginApi() = default;

  /** @brief The owner tag applied to everything registered through this api */
  virtual std::string_view owner_tag() const = 0;

  virtual expected<void, rpc::Fault> register_operation(string name, OperationHandler handler,
                                                        std::optional<AuthLevel> min_level) = 0;

  virtual void subscribe_handler(string event_name, EventHandler handler) = 0;

  /** @return The number of sessions the event was queued for */
  virtual std::size_t publish(const rpc::Event& event) = 0;
};

// ------------------------------------------------------------------------------------------ Plugin

/**
 * @brief Extension code, loaded and unloaded at runtime.
 *
 * `enable` throws to report failure, in which case the plugin manager rolls back whatever
 * the plugin registered. `disable` should release anything the plugin holds outside the
 * daemon's registries; it is called on unload, and failures are logged only.
 *
 * A shared object plugin exports two `extern "C"` functions:
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * extern "C" int haul_plugin_abi_version() { return HAUL_PLUGIN_ABI_VERSION; }
 * extern "C" haul::Plugin* haul_plugin_create() { return new MyPlugin{}; }
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class Plugin {
public:
  virtual ~Plugin() = default;

  virtual std::string_view name() const = 0;
  virtual std::string_view version() const = 0;

  virtual void enable(PluginApi& api) = 0;
  virtual void disable() = 0;
};

} // namespace haul

extern "C" {
using haul_plugin_abi_version_fn = int (*)();
using haul_plugin_create_fn = haul::Plugin* (*)();
}
