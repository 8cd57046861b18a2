
#include "plugin-manager.hpp"

#include <dlfcn.h>

namespace haul {

using rpc::Fault;
using rpc::FaultKind;

static Fault load_error_(string message, string details = "") {
  return Fault{FaultKind::PLUGIN_LOAD_ERROR, std::move(message), std::move(details)};
}

static bool is_shared_object_path_(std::string_view source) {
  return source.find('/') != std::string_view::npos || source.ends_with(".so");
}

namespace detail {

  // --------------------------------------------------------------------------------- SharedLibrary

  class SharedLibrary {
  private:
    void* handle_{nullptr};
    string path_;

  public:
    SharedLibrary(void* handle, string path) : handle_{handle}, path_{std::move(path)} {}
    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;
    ~SharedLibrary() {
      if (handle_ != nullptr && ::dlclose(handle_) != 0) {
        const char* message = ::dlerror();
        WARN("dlclose('{}') failed: {}", path_, message ? message : "");
      }
    }

    static expected<shared_ptr<SharedLibrary>, Fault> open(const string& path) {
      ::dlerror(); // clear
      void* handle = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
      if (handle == nullptr) {
        const char* message = ::dlerror();
        return make_unexpected(load_error_(format("failed to open '{}'", path),
                                           message ? message : "unknown dlopen error"));
      }
      return make_shared<SharedLibrary>(handle, path);
    }

    template <typename F> expected<F, Fault> symbol(const char* name) const {
      ::dlerror();
      void* address = ::dlsym(handle_, name);
      const char* message = ::dlerror();
      if (message != nullptr || address == nullptr)
        return make_unexpected(load_error_(format("'{}' does not export '{}'", path_, name),
                                           message ? message : ""));
      return reinterpret_cast<F>(address);
    }

    const string& path() const { return path_; }
  };

  // ------------------------------------------------------------------------------- TaggedPluginApi

  class TaggedPluginApi final : public PluginApi {
  private:
    RpcDispatcher& dispatcher_;
    EventManager& events_;
    const string tag_;
    std::function<shared_ptr<void>()> keep_alive_;

  public:
    TaggedPluginApi(RpcDispatcher& dispatcher, EventManager& events, string tag,
                    std::function<shared_ptr<void>()> keep_alive)
        : dispatcher_{dispatcher}, events_{events}, tag_{std::move(tag)},
          keep_alive_{std::move(keep_alive)} {}

    std::string_view owner_tag() const override { return tag_; }

    expected<void, Fault> register_operation(string name, OperationHandler handler,
                                             std::optional<AuthLevel> min_level) override {
      return dispatcher_.register_operation(std::move(name), std::move(handler), min_level, tag_,
                                            keep_alive_());
    }

    void subscribe_handler(string event_name, EventHandler handler) override {
      events_.subscribe_handler(std::move(event_name), std::move(handler), tag_, keep_alive_());
    }

    std::size_t publish(const rpc::Event& event) override { return events_.publish(event); }
  };

  // ---------------------------------------------------------------------------------- LoadedPlugin

  /**
   * Registry entries made by the plugin hold a `shared_ptr` to this, so the plugin's code
   * stays mapped until the last call into it returns.
   */
  struct LoadedPlugin {
    shared_ptr<SharedLibrary> library; //!< Declared first, so it is closed last
    unique_ptr<Plugin> plugin;
    unique_ptr<TaggedPluginApi> api;
  };

} // namespace detail

// ------------------------------------------------------------------------------------ Construction

PluginManager::PluginManager(RpcDispatcher& dispatcher, EventManager& events)
    : Component{"PluginManager"}, dispatcher_{dispatcher}, events_{events} {}

PluginManager::~PluginManager() = default;

void PluginManager::register_factory(string name, PluginFactory factory) {
  std::lock_guard lock{padlock_};
  factories_.insert_or_assign(std::move(name), std::move(factory));
}

vector<string> PluginManager::available() const {
  std::lock_guard lock{padlock_};
  vector<string> out;
  out.reserve(factories_.size());
  for (const auto& [name, factory] : factories_)
    out.push_back(name);
  return out;
}

// ------------------------------------------------------------------------------------- instantiate

expected<shared_ptr<detail::LoadedPlugin>, Fault>
PluginManager::instantiate_(std::string_view name, std::string_view source) {
  auto loaded = make_shared<detail::LoadedPlugin>();

  PluginFactory factory;
  {
    std::lock_guard lock{padlock_};
    if (auto ii = factories_.find(source); ii != factories_.end())
      factory = ii->second;
  }

  if (factory) {
    try {
      loaded->plugin = factory();
    } catch (std::exception& e) {
      return make_unexpected(load_error_(format("factory for '{}' threw", source), e.what()));
    } catch (...) {
      return make_unexpected(load_error_(format("factory for '{}' threw", source)));
    }
  } else if (is_shared_object_path_(source)) {
    auto library = detail::SharedLibrary::open(string{source});
    if (!library)
      return make_unexpected(library.error());
    loaded->library = std::move(*library);

    auto abi_version =
        loaded->library->symbol<haul_plugin_abi_version_fn>("haul_plugin_abi_version");
    if (!abi_version)
      return make_unexpected(abi_version.error());
    if (const auto version = (*abi_version)(); version != HAUL_PLUGIN_ABI_VERSION)
      return make_unexpected(load_error_(format("'{}' has plugin abi version {}, expected {}",
                                                source, version, HAUL_PLUGIN_ABI_VERSION)));

    auto create = loaded->library->symbol<haul_plugin_create_fn>("haul_plugin_create");
    if (!create)
      return make_unexpected(create.error());
    try {
      loaded->plugin.reset((*create)());
    } catch (std::exception& e) {
      return make_unexpected(load_error_(format("'{}' threw creating its plugin", source),
                                         e.what()));
    } catch (...) {
      return make_unexpected(load_error_(format("'{}' threw creating its plugin", source)));
    }
  } else {
    return make_unexpected(load_error_(format("no plugin named '{}'", source)));
  }

  if (loaded->plugin == nullptr)
    return make_unexpected(load_error_(format("'{}' did not create a plugin", source)));

  std::weak_ptr<detail::LoadedPlugin> weak = loaded;
  loaded->api = make_unique<detail::TaggedPluginApi>(
      dispatcher_, events_, string{name}, [weak]() -> shared_ptr<void> { return weak.lock(); });
  return loaded;
}

// -------------------------------------------------------------------------------------------- Load

void PluginManager::rollback_(std::string_view tag) {
  const auto operations = dispatcher_.unregister_all(tag);
  const auto handlers = events_.unsubscribe_all(tag);
  TRACE("rolled back '{}': {} operation(s), {} handler(s)", tag, operations, handlers);
}

expected<PluginInfo, Fault> PluginManager::load(std::string_view name, std::string_view source) {
  if (name.empty())
    return make_unexpected(load_error_("a plugin needs a name",
                                       "the empty owner tag belongs to built-in operations"));
  if (source.empty())
    source = name;

  std::lock_guard lifecycle{lifecycle_padlock_};
  if (is_loaded(name))
    return make_unexpected(load_error_(format("plugin '{}' is already loaded", name)));

  auto loaded = instantiate_(name, source);
  if (!loaded) {
    WARN("failed to load plugin '{}': {} {}", name, loaded.error().message(),
         loaded.error().details());
    return make_unexpected(loaded.error());
  }

  auto& plugin = *(*loaded)->plugin;
  if (plugin.name() != name)
    INFO("plugin '{}' is loaded under the name '{}'", plugin.name(), name);

  try {
    plugin.enable(*(*loaded)->api);
  } catch (std::exception& e) {
    rollback_(name);
    WARN("plugin '{}' failed to enable: {}", name, e.what());
    return make_unexpected(load_error_(format("plugin '{}' failed to enable", name), e.what()));
  } catch (...) {
    rollback_(name);
    WARN("plugin '{}' failed to enable with a non-standard exception", name);
    return make_unexpected(load_error_(format("plugin '{}' failed to enable", name)));
  }

  PluginInfo info{string{name}, string{plugin.version()}, string{source}, true};
  {
    std::lock_guard lock{padlock_};
    plugins_.insert_or_assign(string{name}, PluginRecord{info, next_sequence_++, *loaded});
  }
  INFO("plugin '{}' version {} enabled", info.name, info.version);
  return info;
}

// ------------------------------------------------------------------------------------------ Unload

bool PluginManager::unload(std::string_view name) {
  std::lock_guard lifecycle{lifecycle_padlock_};

  shared_ptr<detail::LoadedPlugin> loaded;
  {
    std::lock_guard lock{padlock_};
    auto ii = plugins_.find(name);
    if (ii != plugins_.end())
      loaded = ii->second.loaded;
  }

  if (loaded == nullptr) {
    WARN("unload: plugin '{}' is not loaded", name);
    return false;
  }

  try {
    loaded->plugin->disable();
  } catch (std::exception& e) {
    LOG_ERR("plugin '{}' failed to disable cleanly: {}", name, e.what());
  } catch (...) {
    LOG_ERR("plugin '{}' failed to disable cleanly: non-standard exception", name);
  }

  rollback_(name);

  {
    std::lock_guard lock{padlock_};
    if (auto ii = plugins_.find(name); ii != plugins_.end())
      plugins_.erase(ii);
  }
  INFO("plugin '{}' unloaded", name);
  return true;
}

void PluginManager::unload_all() {
  vector<std::pair<uint64_t, string>> names;
  {
    std::lock_guard lock{padlock_};
    for (const auto& [name, record] : plugins_)
      names.emplace_back(record.sequence, name);
  }
  std::sort(names.rbegin(), names.rend());
  for (const auto& [sequence, name] : names)
    unload(name);
}

void PluginManager::on_stop() { unload_all(); }

// ----------------------------------------------------------------------------------------- Getters

bool PluginManager::is_loaded(std::string_view name) const {
  std::lock_guard lock{padlock_};
  return plugins_.find(name) != plugins_.end();
}

vector<PluginInfo> PluginManager::plugins() const {
  std::lock_guard lock{padlock_};
  vector<PluginInfo> out;
  out.reserve(plugins_.size());
  for (const auto& [name, record] : plugins_)
    out.push_back(record.info);
  return out;
}

} // namespace haul
