#pragma once

#include "session.hpp"

#include "haul/rpc/message.hpp"
#include "haul/utils/base-include.hpp"

#include <stdexcept>

namespace haul {

/**
 * @brief Everything a handler knows about the call it is servicing.
 *
 * A `CallContext` is created by the dispatcher for exactly one call, and handed to the
 * handler by reference. It must not be retained after the handler returns.
 *
 * The argument accessors throw `std::invalid_argument` when an argument is missing, which
 * the dispatcher reports as a `HANDLER_ERROR`.
 */
class CallContext {
private:
  const rpc::Request& request_;
  shared_ptr<Session> session_;

public:
  CallContext(const rpc::Request& request, shared_ptr<Session> session)
      : request_{request}, session_{std::move(session)} {}
  CallContext(const CallContext&) = delete;
  CallContext& operator=(const CallContext&) = delete;

  uint64_t request_id() const { return request_.request_id; }
  const string& operation() const { return request_.operation; }
  const rpc::Value::List& args() const { return request_.args; }
  const rpc::Value::Dict& kwargs() const { return request_.kwargs; }

  /** @brief The session that made the call */
  Session& session() const { return *session_; }
  const shared_ptr<Session>& session_ptr() const { return session_; }

  /**
   * @brief True once the calling session has started closing. Long running handlers
   * should check this and give up early; their result would be discarded anyway.
   */
  bool is_cancelled() const { return !session_->is_open(); }

  /**
   * @brief The argument named `name`, or else the positional argument at `index`.
   * @return nullptr if neither is present.
   */
  const rpc::Value* find_arg(std::size_t index, std::string_view name) const {
    if (auto ii = request_.kwargs.find(name); ii != request_.kwargs.end())
      return &ii->second;
    if (index < request_.args.size())
      return &request_.args[index];
    return nullptr;
  }

  const rpc::Value& arg(std::size_t index, std::string_view name) const {
    const auto* value = find_arg(index, name);
    if (value == nullptr)
      throw std::invalid_argument(format("missing argument '{}'", name));
    return *value;
  }
};

} // namespace haul
