#pragma once

#include "auth.hpp"
#include "call-context.hpp"
#include "session.hpp"

#include "haul/rpc/fault.hpp"
#include "haul/rpc/message.hpp"
#include "haul/utils/base-include.hpp"

#include <map>
#include <mutex>
#include <optional>

namespace haul {

using OperationHandler = std::function<expected<rpc::Value, rpc::Fault>(CallContext& context)>;

/**
 * @brief One entry in the operation registry. Immutable once registered.
 */
struct OperationRecord {
  shared_ptr<void> keep_alive; //!< Plugin code backing `handler`; declared first, released last
  string name;
  OperationHandler handler;
  std::optional<AuthLevel> min_level; //!< Unset means nobody may call it
  string owner_tag;                   //!< Empty for built-in operations
};

struct OperationInfo {
  string name;
  std::optional<AuthLevel> min_level;
  string owner_tag;
  bool operator==(const OperationInfo&) const = default;
};

// ----------------------------------------------------------------------------------- RpcDispatcher

/**
 * @brief The registry of callable operations, and the dispatch algorithm over it.
 *
 * The registry is a copy-on-write table: `dispatch` takes a reference to the current
 * table and works from that, so it sees an operation either completely registered or
 * not at all, and a handler that is being unregistered stays alive until calls into it
 * finish. Writers are serialized among themselves and never block dispatch for longer
 * than a pointer swap.
 */
class RpcDispatcher {
public:
  using Table = std::map<string, shared_ptr<const OperationRecord>, std::less<>>;

private:
  mutable std::mutex padlock_; //!< Guards `table_` (the pointer)
  std::mutex writer_;          //!< Serializes registry updates
  shared_ptr<const Table> table_;

  shared_ptr<const Table> table_snapshot_() const;

public:
  RpcDispatcher();
  RpcDispatcher(const RpcDispatcher&) = delete;
  RpcDispatcher& operator=(const RpcDispatcher&) = delete;

  /**
   * @return `ALREADY_EXISTS` if `name` is taken, `BAD_REGISTRATION` if `name` is empty or
   *         `handler` is null.
   */
  expected<void, rpc::Fault> register_operation(string name, OperationHandler handler,
                                                std::optional<AuthLevel> min_level,
                                                string owner_tag = "",
                                                shared_ptr<void> keep_alive = nullptr);

  /**
   * @brief Remove every operation registered under `owner_tag`.
   * @return The number of operations removed.
   */
  std::size_t unregister_all(std::string_view owner_tag);

  /**
   * @brief Resolve, authorize and invoke `request` on behalf of `session`.
   * @return A response carrying `request.request_id`; never throws.
   */
  rpc::Response dispatch(const shared_ptr<Session>& session, const rpc::Request& request) const;

  // @{ Introspection
  bool contains(std::string_view name) const;
  std::optional<OperationInfo> describe(std::string_view name) const;
  vector<string> operation_names() const;
  /** @brief The operations callable at `level` */
  vector<string> operation_names(AuthLevel level) const;
  /** @brief The whole registry, in name order */
  vector<OperationInfo> snapshot() const;
  // @}
};

} // namespace haul
