#include "error-codes.hpp"

#include <string>

namespace haul {
namespace {
  /**
   * @private
   */
  struct ECodeCategory : std::error_category {
    const char* name() const noexcept override;
    std::string message(int ev) const override;
  };

  /**
   * @private
   */
  const char* ECodeCategory::name() const noexcept { return "haul"; }

  /**
   * @private
   */
  std::string ECodeCategory::message(int e) const {
    switch (static_cast<ecode>(e)) {
    case ecode::okay: return "okay";
    case ecode::logic_error: return "logic error";
    case ecode::buffer_underflow: return "buffer underflow";
    case ecode::operation_failed: return "operation failed";
    case ecode::exception_occurred: return "exception occurred";
    case ecode::argument_error: return "argument error";
    case ecode::object_too_large: return "object too large";
    case ecode::invalid_data: return "invalid data";
    case ecode::version_mismatch: return "protocol version mismatch";
    case ecode::nesting_too_deep: return "value nesting too deep";
    case ecode::unexpected_message: return "unexpected message type";
    case ecode::trailing_data: return "trailing data after envelope";
    }
    return "(unknown error)";
  }

  /**
   * @private
   */
  static const ECodeCategory ecode_category{};
} // namespace

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), ecode_category}; }

} // namespace haul
