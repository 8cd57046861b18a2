#pragma once

#include "component.hpp"

#include "haul/rpc/fault.hpp"
#include "haul/rpc/value.hpp"
#include "haul/utils/base-include.hpp"

#include <map>
#include <mutex>

namespace haul {

enum class JobVerb : uint8_t { ADD, REMOVE, PAUSE, RESUME, STATUS, LIST };

constexpr std::string_view str(JobVerb verb) {
  switch (verb) {
  case JobVerb::ADD: return "add";
  case JobVerb::REMOVE: return "remove";
  case JobVerb::PAUSE: return "pause";
  case JobVerb::RESUME: return "resume";
  case JobVerb::STATUS: return "status";
  case JobVerb::LIST: return "list";
  }
  return "<unknown verb>";
}

using JobId = int64_t;

struct JobCommand {
  JobVerb verb = JobVerb::LIST;
  JobId job_id = 0;   //!< REMOVE, PAUSE, RESUME, STATUS
  string source;      //!< ADD
  string destination; //!< ADD, optional
};

/**
 * @brief Called with the name of a status change event (`job.added`, `job.status`,
 * `job.removed`) and its payload.
 */
using JobStatusCallback = std::function<void(std::string_view event_name, rpc::Value payload)>;

// --------------------------------------------------------------------------------------- JobEngine

/**
 * @brief The engine that actually runs transfer jobs.
 */
class JobEngine {
public:
  virtual ~JobEngine() = default;

  virtual expected<rpc::Value, rpc::Fault> execute(const JobCommand& command) = 0;

  /** @brief Replaces any previously set callback */
  virtual void on_status_change(JobStatusCallback callback) = 0;
};

// --------------------------------------------------------------------------------- MemoryJobEngine

/**
 * @brief A job engine that keeps its jobs in memory, and makes progress on each update.
 *
 * It does no actual transfers.
 */
class MemoryJobEngine final : public JobEngine, public Component {
public:
  enum class JobState : uint8_t { QUEUED, ACTIVE, PAUSED, FINISHED };

  struct Job {
    JobId id = 0;
    string source;
    string destination;
    JobState state = JobState::QUEUED;
    int progress = 0; //!< Percent
  };

private:
  mutable std::mutex padlock_;
  std::map<JobId, Job> jobs_;
  JobId next_id_{1};
  int progress_step_{10};
  std::map<JobVerb, std::size_t> execute_counts_;
  JobStatusCallback callback_;

  void notify_(std::string_view event_name, rpc::Value payload) const;

protected:
  void on_update() override;

public:
  explicit MemoryJobEngine(int progress_step = 10);

  expected<rpc::Value, rpc::Fault> execute(const JobCommand& command) override;
  void on_status_change(JobStatusCallback callback) override;

  /** @brief How many times `verb` was executed */
  std::size_t execute_count(JobVerb verb) const;
  std::size_t size() const;

  static rpc::Value to_value(const Job& job);
};

constexpr std::string_view str(MemoryJobEngine::JobState state) {
  switch (state) {
  case MemoryJobEngine::JobState::QUEUED: return "Queued";
  case MemoryJobEngine::JobState::ACTIVE: return "Active";
  case MemoryJobEngine::JobState::PAUSED: return "Paused";
  case MemoryJobEngine::JobState::FINISHED: return "Finished";
  }
  return "<unknown state>";
}

} // namespace haul
