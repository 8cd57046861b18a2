#pragma once

/**
 * @defgroup haul Haul
 */

/**
 * @defgroup haul-utils Utilities
 * @ingroup haul
 */

#include "utils/base-include.hpp"

#include "utils/error-codes.hpp"

#include "utils/cli-utils.hpp"
#include "utils/string-utils.hpp"
