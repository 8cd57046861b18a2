#pragma once

#include "event-manager.hpp"
#include "job-engine.hpp"
#include "plugin-manager.hpp"
#include "rpc-dispatcher.hpp"
#include "session-manager.hpp"

#include "haul/rpc/fault.hpp"
#include "haul/utils/base-include.hpp"

namespace haul {

struct CoreServices {
  RpcDispatcher& dispatcher;
  SessionManager& sessions;
  EventManager& events;
  PluginManager& plugins;
  JobEngine& jobs;
  string version = "0.0.0";
  thunk_type request_shutdown = nullptr; //!< Called by `daemon.shutdown`
};

/**
 * @brief Register the built-in `daemon.*` and `job.*` operations, with an empty owner tag.
 *
 * | operation                          | level     |
 * |------------------------------------|-----------|
 * | daemon.login(username, password)   | none      |
 * | daemon.info()                      | none      |
 * | daemon.set_event_interest(names..) | read-only |
 * | daemon.remove_event_interest(..)   | read-only |
 * | daemon.get_method_list()           | read-only |
 * | daemon.plugins()                   | read-only |
 * | daemon.enable_plugin(name, source) | admin     |
 * | daemon.disable_plugin(name)        | admin     |
 * | daemon.shutdown()                  | admin     |
 * | job.add(source, destination)       | standard  |
 * | job.pause(job_id)                  | standard  |
 * | job.resume(job_id)                 | standard  |
 * | job.status(job_id)                 | read-only |
 * | job.list()                         | read-only |
 * | job.remove(job_id)                 | admin     |
 *
 * `services` must outlive the dispatcher's use of the operations.
 */
expected<void, rpc::Fault> register_core_operations(const CoreServices& services);

/**
 * @brief Publish the job engine's status changes through the event manager.
 */
void connect_job_events(JobEngine& jobs, EventManager& events);

} // namespace haul
