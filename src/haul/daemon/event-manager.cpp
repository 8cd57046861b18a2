
#include "event-manager.hpp"

#include "haul/net/envelope.hpp"

namespace haul {

EventManager::EventManager() : handlers_{make_shared<const HandlerTable>()} {}

void EventManager::set_handler_executor(executor_type executor) {
  std::lock_guard lock{padlock_};
  executor_ = std::move(executor);
}

// ---------------------------------------------------------------------------------------- Sessions

bool EventManager::subscribe(const shared_ptr<Session>& session, string filter) {
  if (session == nullptr)
    return false;
  std::lock_guard lock{padlock_};
  if (!session->is_open()) // `remove_session` runs under the same lock
    return false;
  subscribers_.insert_or_assign(session->id(), session);
  return session->add_filter(std::move(filter));
}

bool EventManager::unsubscribe(Session& session, std::string_view filter) {
  std::lock_guard lock{padlock_};
  const bool removed = session.remove_filter(filter);
  if (!session.has_filters())
    subscribers_.erase(session.id());
  return removed;
}

void EventManager::remove_session(SessionId id) {
  shared_ptr<Session> session;
  {
    std::lock_guard lock{padlock_};
    auto ii = subscribers_.find(id);
    if (ii == subscribers_.end())
      return;
    session = ii->second.lock();
    subscribers_.erase(ii);
  }
  if (session)
    session->clear_filters();
}

std::size_t EventManager::subscriber_count() const {
  std::lock_guard lock{padlock_};
  return subscribers_.size();
}

// ----------------------------------------------------------------------------------------- Publish

std::size_t EventManager::publish(const rpc::Event& event) {
  std::size_t delivered = 0;
  shared_ptr<const HandlerTable> handlers;
  executor_type executor;

  {
    std::lock_guard publish_lock{publish_padlock_};

    vector<shared_ptr<Session>> sessions;
    {
      std::lock_guard lock{padlock_};
      sessions.reserve(subscribers_.size());
      for (auto ii = subscribers_.begin(); ii != subscribers_.end();) {
        auto session = ii->second.lock();
        if (session == nullptr) {
          ii = subscribers_.erase(ii);
        } else {
          sessions.push_back(std::move(session));
          ++ii;
        }
      }
      handlers = handlers_;
      executor = executor_;
    }

    net::BufferType encoded;
    bool is_encoded = false;
    for (auto& session : sessions) {
      if (!session->is_interested(event.name))
        continue;
      if (!is_encoded) {
        if (!net::encode(encoded, event)) {
          LOG_ERR("failed to encode event '{}'", event.name);
          break;
        }
        is_encoded = true;
      }
      auto buffer = encoded; // each session owns its copy
      if (session->enqueue_event(std::move(buffer))) {
        ++delivered;
        if (auto connection = session->connection())
          connection->notify_outbound();
      } else {
        TRACE("event '{}' dropped for session {}", event.name, session->id());
      }
    }
  }

  // In-process handlers run outside the publish lock, so they may publish in turn
  for (const auto& record : *handlers) {
    if (!filter_matches(record->event_name, event.name))
      continue;
    auto thunk = [record, event]() {
      try {
        record->handler(event);
      } catch (std::exception& e) {
        LOG_ERR("event handler for '{}' owned by '{}' threw: {}", event.name, record->owner_tag,
                e.what());
      }
    };
    if (executor)
      executor(std::move(thunk));
    else
      thunk();
  }

  return delivered;
}

// ---------------------------------------------------------------------------------------- Handlers

shared_ptr<const EventManager::HandlerTable> EventManager::handlers_snapshot_() const {
  std::lock_guard lock{padlock_};
  return handlers_;
}

void EventManager::subscribe_handler(string event_name, EventHandler handler, string owner_tag,
                                     shared_ptr<void> keep_alive) {
  auto record = make_shared<const HandlerRecord>(HandlerRecord{
      std::move(keep_alive), std::move(event_name), std::move(owner_tag), std::move(handler)});

  std::lock_guard writer{handler_writer_};
  auto table = make_shared<HandlerTable>(*handlers_snapshot_());
  table->push_back(std::move(record));
  std::lock_guard lock{padlock_};
  handlers_ = std::move(table);
}

std::size_t EventManager::unsubscribe_all(std::string_view owner_tag) {
  std::lock_guard writer{handler_writer_};
  auto table = make_shared<HandlerTable>(*handlers_snapshot_());
  const auto before = table->size();
  table->erase(std::remove_if(begin(*table), end(*table),
                              [owner_tag](const auto& record) {
                                return record->owner_tag == owner_tag;
                              }),
               end(*table));
  const auto removed = before - table->size();
  if (removed > 0) {
    std::lock_guard lock{padlock_};
    handlers_ = std::move(table);
  }
  return removed;
}

std::size_t EventManager::handler_count() const { return handlers_snapshot_()->size(); }

vector<EventManager::HandlerInfo> EventManager::handler_snapshot() const {
  auto table = handlers_snapshot_();
  vector<HandlerInfo> out;
  out.reserve(table->size());
  for (const auto& record : *table)
    out.push_back(HandlerInfo{record->event_name, record->owner_tag});
  std::sort(begin(out), end(out));
  return out;
}

} // namespace haul
