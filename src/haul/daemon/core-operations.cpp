
#include "core-operations.hpp"

#include "haul/net/envelope.hpp"

namespace haul {

using rpc::Fault;
using rpc::FaultKind;
using rpc::Value;

namespace {

  using Result = expected<Value, Fault>;

  /// Event names may be passed as separate arguments, or as a single list
  vector<string> string_args(const CallContext& context) {
    vector<string> out;
    for (const auto& arg : context.args()) {
      if (arg.is_list()) {
        for (const auto& item : arg.as_list())
          out.push_back(item.as_string());
      } else {
        out.push_back(arg.as_string());
      }
    }
    return out;
  }

  JobCommand job_command(JobVerb verb, const CallContext& context) {
    return JobCommand{verb, context.arg(0, "job_id").as_int(), {}, {}};
  }

  Value plugin_info_value(const PluginInfo& info) {
    return Value::Dict{{"name", info.name},
                       {"version", info.version},
                       {"source", info.source},
                       {"enabled", info.enabled}};
  }

} // namespace

expected<void, Fault> register_core_operations(const CoreServices& services) {
  auto& dispatcher = services.dispatcher;
  auto& sessions = services.sessions;
  auto& events = services.events;
  auto& plugins = services.plugins;
  auto& jobs = services.jobs;

  const std::pair<const char*, std::pair<OperationHandler, AuthLevel>> operations[] = {
      // ---------------------------------------------------------------------------------- daemon.*
      {"daemon.login",
       {[&sessions](CallContext& context) -> Result {
          Credentials credentials{context.arg(0, "username").as_string(),
                                  context.arg(1, "password").as_string()};
          auto level = sessions.authenticate(context.session(), credentials);
          if (!level)
            return make_unexpected(level.error());
          return Value::Dict{{"level", int(*level)}, {"name", str(*level)}};
        },
        AuthLevel::NONE}},

      {"daemon.info",
       {[version = services.version](CallContext&) -> Result {
          return Value::Dict{{"version", version},
                             {"protocol_version", int(net::k_protocol_version)}};
        },
        AuthLevel::NONE}},

      {"daemon.set_event_interest",
       {[&events](CallContext& context) -> Result {
          for (auto& name : string_args(context))
            events.subscribe(context.session_ptr(), std::move(name));
          return Value{true};
        },
        AuthLevel::READ_ONLY}},

      {"daemon.remove_event_interest",
       {[&events](CallContext& context) -> Result {
          for (const auto& name : string_args(context))
            events.unsubscribe(context.session(), name);
          return Value{true};
        },
        AuthLevel::READ_ONLY}},

      {"daemon.get_method_list",
       {[&dispatcher](CallContext&) -> Result {
          Value::List names;
          for (auto& name : dispatcher.operation_names())
            names.emplace_back(std::move(name));
          return names;
        },
        AuthLevel::READ_ONLY}},

      {"daemon.plugins",
       {[&plugins](CallContext&) -> Result {
          Value::List out;
          for (const auto& info : plugins.plugins())
            out.push_back(plugin_info_value(info));
          return out;
        },
        AuthLevel::READ_ONLY}},

      {"daemon.enable_plugin",
       {[&plugins](CallContext& context) -> Result {
          const auto& name = context.arg(0, "name").as_string();
          const auto* source = context.find_arg(1, "source");
          auto info = plugins.load(name, source ? std::string_view{source->as_string()} : "");
          if (!info)
            return make_unexpected(info.error());
          return plugin_info_value(*info);
        },
        AuthLevel::ADMIN}},

      {"daemon.disable_plugin",
       {[&plugins](CallContext& context) -> Result {
          return Value{plugins.unload(context.arg(0, "name").as_string())};
        },
        AuthLevel::ADMIN}},

      {"daemon.shutdown",
       {[request_shutdown = services.request_shutdown](CallContext& context) -> Result {
          if (!request_shutdown)
            return make_unexpected(Fault{FaultKind::HANDLER_ERROR, "shutdown is not supported"});
          INFO("shutdown requested by session {}", context.session().id());
          request_shutdown();
          return Value{true};
        },
        AuthLevel::ADMIN}},

      // ------------------------------------------------------------------------------------- job.*
      {"job.add",
       {[&jobs](CallContext& context) -> Result {
          const auto* destination = context.find_arg(1, "destination");
          return jobs.execute(JobCommand{JobVerb::ADD, 0, context.arg(0, "source").as_string(),
                                         destination ? destination->as_string() : ""});
        },
        AuthLevel::STANDARD}},

      {"job.pause",
       {[&jobs](CallContext& context) -> Result {
          return jobs.execute(job_command(JobVerb::PAUSE, context));
        },
        AuthLevel::STANDARD}},

      {"job.resume",
       {[&jobs](CallContext& context) -> Result {
          return jobs.execute(job_command(JobVerb::RESUME, context));
        },
        AuthLevel::STANDARD}},

      {"job.status",
       {[&jobs](CallContext& context) -> Result {
          return jobs.execute(job_command(JobVerb::STATUS, context));
        },
        AuthLevel::READ_ONLY}},

      {"job.list",
       {[&jobs](CallContext&) -> Result { return jobs.execute(JobCommand{JobVerb::LIST}); },
        AuthLevel::READ_ONLY}},

      {"job.remove",
       {[&jobs](CallContext& context) -> Result {
          return jobs.execute(job_command(JobVerb::REMOVE, context));
        },
        AuthLevel::ADMIN}},
  };

  for (const auto& [name, operation] : operations) {
    auto success = dispatcher.register_operation(name, operation.first, operation.second);
    if (!success)
      return success;
  }
  return {};
}

void connect_job_events(JobEngine& jobs, EventManager& events) {
  jobs.on_status_change([&events](std::string_view event_name, Value payload) {
    events.publish(rpc::Event::make(string{event_name}, std::move(payload)));
  });
}

} // namespace haul
