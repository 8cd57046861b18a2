#pragma once

#include "fault.hpp"
#include "value.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace haul::rpc {

/**
 * @brief A call to a named operation; `request_id` is chosen by the client and is unique
 * within the issuing session while the call is outstanding.
 */
struct Request {
  uint64_t request_id{0};
  std::string operation;
  Value::List args;
  Value::Dict kwargs;
};

/**
 * @brief The one answer to a `Request`. Carries `result` iff `fault.ok()`.
 */
struct Response {
  uint64_t request_id{0};
  Value result{};
  Fault fault{};

  bool ok() const { return fault.ok(); }

  static Response success(uint64_t request_id, Value result) {
    return Response{request_id, std::move(result), Fault{}};
  }

  static Response failure(uint64_t request_id, Fault fault) {
    return Response{request_id, Value{}, std::move(fault)};
  }
};

/**
 * @brief A state change, fanned out to interested sessions. Never persisted.
 */
struct Event {
  std::string name;
  Value payload{};
  int64_t timestamp_micros{0}; //!< Microseconds since the unix epoch

  static Event make(std::string name, Value payload) {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return Event{std::move(name), std::move(payload),
                 std::chrono::duration_cast<std::chrono::microseconds>(now).count()};
  }
};

} // namespace haul::rpc
