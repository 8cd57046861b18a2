#pragma once

#include "component.hpp"
#include "plugin.hpp"

#include "haul/rpc/fault.hpp"
#include "haul/utils/base-include.hpp"

#include <map>
#include <mutex>

namespace haul {

namespace detail {
  struct LoadedPlugin;
}

using PluginFactory = std::function<unique_ptr<Plugin>()>;

struct PluginInfo {
  string name;
  string version;
  string source;
  bool enabled = false;
};

// ----------------------------------------------------------------------------------- PluginManager

/**
 * @brief Loads and unloads plugins.
 *
 * A plugin's code source is either the name of a factory registered with
 * `register_factory`, or the path of a shared object. After a failed `load`, the
 * operation registry and event handler tables are as they were before the attempt.
 *
 * Load and unload are serialized; dispatch and publish carry on concurrently.
 */
class PluginManager final : public Component {
private:
  struct PluginRecord {
    PluginInfo info;
    uint64_t sequence = 0; //!< Load order
    shared_ptr<detail::LoadedPlugin> loaded;
  };

  mutable std::mutex padlock_;  //!< Guards the maps
  std::mutex lifecycle_padlock_; //!< Serializes load/unload
  RpcDispatcher& dispatcher_;
  EventManager& events_;
  std::map<string, PluginFactory, std::less<>> factories_;
  std::map<string, PluginRecord, std::less<>> plugins_;
  uint64_t next_sequence_{0};

  expected<shared_ptr<detail::LoadedPlugin>, rpc::Fault> instantiate_(std::string_view name,
                                                                      std::string_view source);
  void rollback_(std::string_view tag);

protected:
  void on_stop() override;

public:
  PluginManager(RpcDispatcher& dispatcher, EventManager& events);
  ~PluginManager() override;

  /** @brief Make a built-in plugin available under `name` */
  void register_factory(string name, PluginFactory factory);
  vector<string> available() const;

  /**
   * @brief Instantiate the plugin from `source`, and enable it under the tag `name`.
   * @param source A factory name or a shared object path. Empty means `name`.
   * @return `PLUGIN_LOAD_ERROR` if the plugin cannot be created or enabled, or `name`
   *         is empty or already loaded.
   */
  expected<PluginInfo, rpc::Fault> load(std::string_view name, std::string_view source = "");

  /**
   * @brief Disable the plugin, and remove everything it registered.
   * @return false (and logs) if `name` was not loaded.
   */
  bool unload(std::string_view name);

  /** @brief Unload every plugin, most recently loaded first */
  void unload_all();

  bool is_loaded(std::string_view name) const;
  vector<PluginInfo> plugins() const;
};

} // namespace haul
