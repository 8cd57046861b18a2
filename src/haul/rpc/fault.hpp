#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace haul::rpc {

/**
 * @brief The kinds of failure a `Response` can carry.
 *
 * Only `PROTOCOL_ERROR` is fatal to a connection; everything else is answered as an
 * ordinary fault, and the session stays open.
 */
enum class FaultKind : uint8_t {
  OK = 0,
  PROTOCOL_ERROR,    //!< Malformed frame or codec failure
  AUTH_ERROR,        //!< Bad credentials, or insufficient level for an operation
  METHOD_NOT_FOUND,  //!< No operation is registered under the requested name
  HANDLER_ERROR,     //!< The operation's implementation failed
  PLUGIN_LOAD_ERROR, //!< A plugin could not be loaded or enabled
  TIMEOUT,           //!< The session idled out, or a handler exceeded the call timeout
  ALREADY_EXISTS,    //!< Registration under a name that is already taken
  BAD_REGISTRATION,  //!< Registration without a name or a handler
  DO_NOT_USE
};

constexpr std::string_view str(FaultKind kind) {
#define CASE(x)                                                                                    \
  case FaultKind::x:                                                                               \
    return #x
  switch (kind) {
    CASE(OK);
    CASE(PROTOCOL_ERROR);
    CASE(AUTH_ERROR);
    CASE(METHOD_NOT_FOUND);
    CASE(HANDLER_ERROR);
    CASE(PLUGIN_LOAD_ERROR);
    CASE(TIMEOUT);
    CASE(ALREADY_EXISTS);
    CASE(BAD_REGISTRATION);
    CASE(DO_NOT_USE);
  }
#undef CASE
  return "<unknown fault>";
}

class Fault {
private:
  std::string message_{};
  std::string details_{};
  FaultKind kind_{FaultKind::OK};

public:
  Fault(FaultKind kind = FaultKind::OK, std::string message = "", std::string details = "")
      : message_{std::move(message)}, details_{std::move(details)}, kind_{kind} {}

  FaultKind kind() const { return kind_; }
  std::string_view message() const { return message_; }
  std::string_view details() const { return details_; }
  bool ok() const { return kind_ == FaultKind::OK; }

  bool operator==(const Fault& o) const {
    return (kind_ == o.kind_) && (message_ == o.message_) && (details_ == o.details_);
  }
  bool operator!=(const Fault& o) const { return !(*this == o); }
};

} // namespace haul::rpc
