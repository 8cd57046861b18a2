
#include "label-plugin.hpp"

#include "haul/utils/string-utils.hpp"

#include <stdexcept>

namespace haul::plugins {

using rpc::Fault;
using rpc::FaultKind;
using rpc::Value;

namespace {
  using Result = expected<Value, Fault>;

  void require_registered(const expected<void, Fault>& result) {
    if (!result)
      throw std::runtime_error(
          format("{}: {}", result.error().message(), result.error().details()));
  }
} // namespace

void LabelPlugin::publish_change_(JobId job_id, std::string_view label) {
  PluginApi* api = nullptr;
  {
    std::lock_guard lock{padlock_};
    api = api_;
  }
  if (api != nullptr)
    api->publish(rpc::Event::make("label.changed", Value::Dict{{"id", job_id}, {"label", label}}));
}

void LabelPlugin::enable(PluginApi& api) {
  {
    std::lock_guard lock{padlock_};
    api_ = &api;
  }

  require_registered(api.register_operation(
      "label.set",
      [this](CallContext& context) -> Result {
        const auto job_id = context.arg(0, "job_id").as_int();
        const auto label = trim_copy(context.arg(1, "label").as_string());
        if (label.size() > k_max_label_size)
          return make_unexpected(Fault{FaultKind::HANDLER_ERROR, "label too long",
                                       format("at most {} characters", k_max_label_size)});
        {
          std::lock_guard lock{padlock_};
          if (label.empty())
            labels_.erase(job_id);
          else
            labels_[job_id] = label;
        }
        publish_change_(job_id, label);
        return Value{true};
      },
      AuthLevel::STANDARD));

  require_registered(api.register_operation(
      "label.get",
      [this](CallContext& context) -> Result {
        const auto job_id = context.arg(0, "job_id").as_int();
        std::lock_guard lock{padlock_};
        auto ii = labels_.find(job_id);
        return (ii == labels_.end()) ? Value{} : Value{ii->second};
      },
      AuthLevel::READ_ONLY));

  require_registered(api.register_operation(
      "label.list",
      [this](CallContext&) -> Result {
        Value::Dict out;
        std::lock_guard lock{padlock_};
        for (const auto& [job_id, label] : labels_)
          out.insert({std::to_string(job_id), Value{label}});
        return out;
      },
      AuthLevel::READ_ONLY));

  api.subscribe_handler("job.removed", [this](const rpc::Event& event) {
    const auto* id = event.payload.find("id");
    if (id == nullptr || !id->is_int())
      return;
    std::lock_guard lock{padlock_};
    labels_.erase(id->as_int());
  });

  INFO("label plugin enabled");
}

void LabelPlugin::disable() {
  std::lock_guard lock{padlock_};
  labels_.clear();
  api_ = nullptr;
}

std::size_t LabelPlugin::size() const {
  std::lock_guard lock{padlock_};
  return labels_.size();
}

unique_ptr<Plugin> make_label_plugin() { return make_unique<LabelPlugin>(); }

} // namespace haul::plugins
