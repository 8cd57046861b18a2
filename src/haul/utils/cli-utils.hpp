#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup cli Command Line Utils
 * @ingroup haul-utils
 *
 * Helpers for the `for (int i = 1; i < argc; ++i)` style of option parsing used by
 * `hauld` and the example tools.
 */

namespace haul::cli {

/**
 * @brief The value following the option at `argv[i]`; advances `i` past it.
 * @throws std::runtime_error when there is no value.
 */
std::string safe_arg_str(int argc, char** argv, int& i);

/**
 * @brief As `safe_arg_str`, but the value must be a base 10 `int`.
 * @throws std::runtime_error when there is no value, or it is not an integer.
 */
int safe_arg_int(int argc, char** argv, int& i);

// -------------------------------------------------------------------------------------- parse args

/** @brief Split `line` the way a shell would, honouring quotes and backslash escapes */
std::vector<std::string> parse_cmd_args(const std::string_view line);

} // namespace haul::cli
