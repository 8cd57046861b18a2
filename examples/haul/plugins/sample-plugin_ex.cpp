
#include "haul/daemon/plugin.hpp"

#include <atomic>
#include <stdexcept>

// A plugin built as a shared object, and loaded with `hauld --plugin path/to/libhaul-sample.so`

namespace haul::example {

using rpc::Fault;
using rpc::Value;

class SamplePlugin final : public Plugin {
private:
  std::atomic<int64_t> job_events_{0};

  static void require(const expected<void, Fault>& result) {
    if (!result)
      throw std::runtime_error(string{result.error().message()});
  }

public:
  std::string_view name() const override { return "sample"; }
  std::string_view version() const override { return "0.1"; }

  void enable(PluginApi& api) override {
    // Returns its arguments
    require(api.register_operation(
        "sample.echo",
        [](CallContext& context) -> expected<Value, Fault> { return Value{context.args()}; },
        AuthLevel::READ_ONLY));

    require(api.register_operation(
        "sample.fail",
        [](CallContext&) -> expected<Value, Fault> {
          throw std::runtime_error("sample.fail always fails");
        },
        AuthLevel::STANDARD));

    require(api.register_operation(
        "sample.job_events",
        [this](CallContext&) -> expected<Value, Fault> {
          return Value{job_events_.load(std::memory_order_relaxed)};
        },
        AuthLevel::READ_ONLY));

    api.subscribe_handler("job.*", [this](const rpc::Event&) {
      job_events_.fetch_add(1, std::memory_order_relaxed);
    });
  }

  void disable() override { job_events_.store(0, std::memory_order_relaxed); }
};

} // namespace haul::example

extern "C" {

int haul_plugin_abi_version() { return HAUL_PLUGIN_ABI_VERSION; }

haul::Plugin* haul_plugin_create() { return new haul::example::SamplePlugin{}; }
}
