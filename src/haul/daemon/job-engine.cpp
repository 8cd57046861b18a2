
#include "job-engine.hpp"

namespace haul {

using rpc::Fault;
using rpc::FaultKind;
using rpc::Value;

MemoryJobEngine::MemoryJobEngine(int progress_step)
    : Component{"JobEngine"}, progress_step_{std::clamp(progress_step, 1, 100)} {}

Value MemoryJobEngine::to_value(const Job& job) {
  return Value::Dict{{"id", job.id},
                     {"source", job.source},
                     {"destination", job.destination},
                     {"state", str(job.state)},
                     {"progress", job.progress}};
}

void MemoryJobEngine::on_status_change(JobStatusCallback callback) {
  std::lock_guard lock{padlock_};
  callback_ = std::move(callback);
}

void MemoryJobEngine::notify_(std::string_view event_name, Value payload) const {
  JobStatusCallback callback;
  {
    std::lock_guard lock{padlock_};
    callback = callback_;
  }
  if (callback)
    callback(event_name, std::move(payload));
}

std::size_t MemoryJobEngine::execute_count(JobVerb verb) const {
  std::lock_guard lock{padlock_};
  auto ii = execute_counts_.find(verb);
  return (ii == execute_counts_.end()) ? 0 : ii->second;
}

std::size_t MemoryJobEngine::size() const {
  std::lock_guard lock{padlock_};
  return jobs_.size();
}

// ----------------------------------------------------------------------------------------- execute

expected<Value, Fault> MemoryJobEngine::execute(const JobCommand& command) {
  auto no_such_job = [&command]() {
    return make_unexpected(Fault{FaultKind::HANDLER_ERROR, format("no job {}", command.job_id)});
  };

  const char* event_name = nullptr;
  Value event_payload;
  Value result;

  {
    std::lock_guard lock{padlock_};
    ++execute_counts_[command.verb];

    switch (command.verb) {
    case JobVerb::ADD: {
      if (command.source.empty())
        return make_unexpected(Fault{FaultKind::HANDLER_ERROR, "job needs a source"});
      Job job{next_id_++, command.source, command.destination, JobState::QUEUED, 0};
      if (job.destination.empty())
        job.destination = command.source.substr(command.source.find_last_of('/') + 1);
      result = to_value(job);
      jobs_.insert({job.id, job});
      event_name = "job.added";
      event_payload = result;
    } break;

    case JobVerb::REMOVE: {
      if (jobs_.erase(command.job_id) == 0)
        return no_such_job();
      result = Value{true};
      event_name = "job.removed";
      event_payload = Value::Dict{{"id", command.job_id}};
    } break;

    case JobVerb::PAUSE:
    case JobVerb::RESUME: {
      auto ii = jobs_.find(command.job_id);
      if (ii == jobs_.end())
        return no_such_job();
      auto& job = ii->second;
      const auto next_state = (command.verb == JobVerb::PAUSE) ? JobState::PAUSED
                              : (job.progress > 0)             ? JobState::ACTIVE
                                                               : JobState::QUEUED;
      if (job.state != JobState::FINISHED && job.state != next_state) {
        job.state = next_state;
        event_name = "job.status";
        event_payload = to_value(job);
      }
      result = to_value(job);
    } break;

    case JobVerb::STATUS: {
      auto ii = jobs_.find(command.job_id);
      if (ii == jobs_.end())
        return no_such_job();
      result = to_value(ii->second);
    } break;

    case JobVerb::LIST: {
      Value::List list;
      list.reserve(jobs_.size());
      for (const auto& [id, job] : jobs_)
        list.push_back(to_value(job));
      result = std::move(list);
    } break;
    }
  }

  if (event_name != nullptr)
    notify_(event_name, std::move(event_payload));
  return result;
}

// ------------------------------------------------------------------------------------------ update

void MemoryJobEngine::on_update() {
  vector<Value> changes;
  {
    std::lock_guard lock{padlock_};
    for (auto& [id, job] : jobs_) {
      if (job.state == JobState::QUEUED) {
        job.state = JobState::ACTIVE;
      } else if (job.state == JobState::ACTIVE) {
        job.progress = std::min(100, job.progress + progress_step_);
        if (job.progress == 100)
          job.state = JobState::FINISHED;
      } else {
        continue;
      }
      changes.push_back(to_value(job));
    }
  }
  for (auto& change : changes)
    notify_("job.status", std::move(change));
}

} // namespace haul
