#pragma once

#include "session.hpp"

#include "haul/rpc/message.hpp"
#include "haul/utils/base-include.hpp"

#include <map>
#include <mutex>
#include <tuple>

namespace haul {

using EventHandler = std::function<void(const rpc::Event& event)>;

// ------------------------------------------------------------------------------------ EventManager

/**
 * @brief Fans events out to subscribed sessions, and to in-process handlers.
 *
 * Sessions keep their own filters; the manager only tracks which sessions have any.
 * `publish` calls are serialized, so every session sees events in publish order. An
 * event is dropped for a session whose queue is full or that is closing, and that never
 * blocks the publisher.
 *
 * In-process handlers (registered by plugins, under an owner tag) run after the session
 * fan-out, on the handler executor if one is set, or on the publishing thread otherwise.
 * An exception thrown by a handler is logged.
 */
class EventManager {
public:
  using executor_type = std::function<void(thunk_type&& thunk)>;

  struct HandlerInfo {
    string event_name;
    string owner_tag;
    bool operator==(const HandlerInfo&) const = default;
    bool operator<(const HandlerInfo& o) const {
      return std::tie(event_name, owner_tag) < std::tie(o.event_name, o.owner_tag);
    }
  };

private:
  struct HandlerRecord {
    shared_ptr<void> keep_alive; //!< Released last
    string event_name;
    string owner_tag;
    EventHandler handler;
  };
  using HandlerTable = vector<shared_ptr<const HandlerRecord>>;

  mutable std::mutex padlock_;  //!< Guards the members below
  std::mutex publish_padlock_;  //!< Serializes `publish`
  std::mutex handler_writer_;   //!< Serializes handler table updates
  std::map<SessionId, weak_ptr<Session>> subscribers_;
  shared_ptr<const HandlerTable> handlers_;
  executor_type executor_;

  shared_ptr<const HandlerTable> handlers_snapshot_() const;

public:
  EventManager();
  EventManager(const EventManager&) = delete;
  EventManager& operator=(const EventManager&) = delete;

  void set_handler_executor(executor_type executor);

  // @{ Sessions
  /** @return false if the session already had `filter`, or is closing */
  bool subscribe(const shared_ptr<Session>& session, string filter);
  /** @return false if the session did not have `filter` */
  bool unsubscribe(Session& session, std::string_view filter);
  /** @brief Forget the session, and clear its filters */
  void remove_session(SessionId id);
  std::size_t subscriber_count() const;
  // @}

  /**
   * @brief Deliver `event` to every matching session and handler.
   * @return The number of sessions that the event was queued for.
   */
  std::size_t publish(const rpc::Event& event);

  // @{ In-process handlers
  void subscribe_handler(string event_name, EventHandler handler, string owner_tag,
                         shared_ptr<void> keep_alive = nullptr);
  /** @return The number of handlers removed */
  std::size_t unsubscribe_all(std::string_view owner_tag);
  std::size_t handler_count() const;
  /** @brief Sorted description of the handler table */
  vector<HandlerInfo> handler_snapshot() const;
  // @}
};

} // namespace haul
