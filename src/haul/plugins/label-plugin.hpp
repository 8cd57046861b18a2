#pragma once

#include "haul/daemon/job-engine.hpp"
#include "haul/daemon/plugin.hpp"
#include "haul/utils/base-include.hpp"

#include <map>
#include <mutex>

namespace haul::plugins {

/**
 * @brief Attaches a free-form label to jobs.
 *
 * | operation                | level     |
 * |--------------------------|-----------|
 * | label.set(job_id, label) | standard  |
 * | label.get(job_id)        | read-only |
 * | label.list()             | read-only |
 *
 * Setting an empty label removes it. A label is forgotten when its job is removed, and
 * every change is published as `label.changed`.
 */
class LabelPlugin final : public Plugin {
private:
  mutable std::mutex padlock_;
  std::map<JobId, string> labels_;
  PluginApi* api_{nullptr};

  void publish_change_(JobId job_id, std::string_view label);

public:
  static constexpr std::string_view k_name = "label";
  static constexpr std::size_t k_max_label_size = 128;

  std::string_view name() const override { return k_name; }
  std::string_view version() const override { return "1.0"; }

  void enable(PluginApi& api) override;
  void disable() override;

  std::size_t size() const;
};

unique_ptr<Plugin> make_label_plugin();

} // namespace haul::plugins
