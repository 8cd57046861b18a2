#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup haul-utils
 *
 * Low level failures of the codec and transport are reported as `std::error_code`.
 * They are promoted to a `haul::Fault` at the point where a session is affected.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // Truncated frame
 * return make_error_code(ecode::buffer_underflow);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace haul {
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of haul error codes.
 */
enum class ecode : int {
  okay = 0,           //!< i.e., everything's okay.
  logic_error,        //!< Faulty logic in the program.
  buffer_underflow,   //!< Attempt to read beyond the end of a frame.
  operation_failed,   //!< Like a system error, but within the program.
  exception_occurred, //!< Exception caught and forwarded as an error_code.
  argument_error,     //!< An invalid argument was supplied.
  object_too_large,   //!< Attempt to read/write an object that is too large.
  invalid_data,       //!< Input data (file/network/etc.) was invalid.
  version_mismatch,   //!< Envelope carries an unsupported protocol version.
  nesting_too_deep,   //!< Value nesting exceeds the codec limit.
  unexpected_message, //!< A well formed envelope of the wrong type for the receiver.
  trailing_data       //!< Bytes left over after decoding a complete envelope.
};
} // namespace haul

namespace std {
template <> struct is_error_code_enum<haul::ecode> : true_type {};
} // namespace std

namespace haul {
error_code make_error_code(ecode);
} // namespace haul
