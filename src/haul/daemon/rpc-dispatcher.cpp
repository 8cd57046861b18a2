
#include "rpc-dispatcher.hpp"

namespace haul {

using rpc::Fault;
using rpc::FaultKind;
using rpc::Request;
using rpc::Response;

static OperationInfo make_info_(const OperationRecord& record) {
  return OperationInfo{record.name, record.min_level, record.owner_tag};
}

// ------------------------------------------------------------------------------------ Construction

RpcDispatcher::RpcDispatcher() : table_{make_shared<const Table>()} {}

shared_ptr<const RpcDispatcher::Table> RpcDispatcher::table_snapshot_() const {
  std::lock_guard lock{padlock_};
  return table_;
}

// ---------------------------------------------------------------------------------------- Registry

expected<void, Fault> RpcDispatcher::register_operation(string name, OperationHandler handler,
                                                        std::optional<AuthLevel> min_level,
                                                        string owner_tag,
                                                        shared_ptr<void> keep_alive) {
  if (name.empty() || !handler)
    return make_unexpected(
        Fault{FaultKind::BAD_REGISTRATION, "operation needs a name and handler"});

  std::lock_guard writer{writer_};
  auto current = table_snapshot_();
  if (auto ii = current->find(name); ii != current->end())
    return make_unexpected(Fault{FaultKind::ALREADY_EXISTS,
                                 format("operation '{}' is already registered", name),
                                 format("owner: '{}'", ii->second->owner_tag)});

  if (!min_level)
    WARN("operation '{}' has no authorization level, and cannot be called", name);

  auto record = make_shared<const OperationRecord>(OperationRecord{
      std::move(keep_alive), name, std::move(handler), min_level, std::move(owner_tag)});
  auto table = make_shared<Table>(*current);
  table->emplace(std::move(name), std::move(record));

  std::lock_guard lock{padlock_};
  table_ = std::move(table);
  return {};
}

std::size_t RpcDispatcher::unregister_all(std::string_view owner_tag) {
  std::lock_guard writer{writer_};
  auto table = make_shared<Table>(*table_snapshot_());
  const auto count = std::erase_if(
      *table, [owner_tag](const auto& item) { return item.second->owner_tag == owner_tag; });
  if (count > 0) {
    std::lock_guard lock{padlock_};
    table_ = std::move(table);
    TRACE("unregistered {} operation(s) owned by '{}'", count, owner_tag);
  }
  return count;
}

// ---------------------------------------------------------------------------------------- Dispatch

Response RpcDispatcher::dispatch(const shared_ptr<Session>& session, const Request& request) const {
  const auto id = request.request_id;

  shared_ptr<const OperationRecord> record;
  {
    auto table = table_snapshot_();
    auto ii = table->find(request.operation);
    if (ii == table->end()) {
      const auto message = format("unknown operation '{}'", request.operation);
      return Response::failure(id, Fault{FaultKind::METHOD_NOT_FOUND, message});
    }
    record = ii->second; // keeps the handler alive, even if unregistered meanwhile
  }

  const auto level = session->level();
  if (!is_authorized(level, record->min_level)) {
    const auto required = record->min_level ? str(*record->min_level) : "<unreachable>";
    return Response::failure(
        id, Fault{FaultKind::AUTH_ERROR,
                  format("operation '{}' requires level {}", record->name, required),
                  format("session level is {}", str(level))});
  }

  CallContext context{request, session};
  try {
    auto result = record->handler(context);
    if (!result) {
      if (result.error().ok())
        return Response::failure(
            id, Fault{FaultKind::HANDLER_ERROR, "handler failed without a fault"});
      return Response::failure(id, std::move(result.error()));
    }
    return Response::success(id, std::move(*result));
  } catch (std::exception& e) {
    WARN("operation '{}' threw: {}", record->name, e.what());
    return Response::failure(id, Fault{FaultKind::HANDLER_ERROR,
                                       format("operation '{}' failed", record->name), e.what()});
  } catch (...) {
    WARN("operation '{}' threw a non-standard exception", record->name);
    return Response::failure(
        id, Fault{FaultKind::HANDLER_ERROR, format("operation '{}' failed", record->name)});
  }
}

// ----------------------------------------------------------------------------------- Introspection

bool RpcDispatcher::contains(std::string_view name) const {
  auto table = table_snapshot_();
  return table->find(name) != table->end();
}

std::optional<OperationInfo> RpcDispatcher::describe(std::string_view name) const {
  auto table = table_snapshot_();
  auto ii = table->find(name);
  if (ii == table->end())
    return std::nullopt;
  return make_info_(*ii->second);
}

vector<string> RpcDispatcher::operation_names() const {
  auto table = table_snapshot_();
  vector<string> out;
  out.reserve(table->size());
  for (const auto& [name, record] : *table)
    out.push_back(name);
  return out;
}

vector<string> RpcDispatcher::operation_names(AuthLevel level) const {
  auto table = table_snapshot_();
  vector<string> out;
  for (const auto& [name, record] : *table)
    if (is_authorized(level, record->min_level))
      out.push_back(name);
  return out;
}

vector<OperationInfo> RpcDispatcher::snapshot() const {
  auto table = table_snapshot_();
  vector<OperationInfo> out;
  out.reserve(table->size());
  for (const auto& [name, record] : *table)
    out.push_back(make_info_(*record));
  return out;
}

} // namespace haul
