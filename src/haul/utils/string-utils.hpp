#pragma once

#include <cctype>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup haul-strings Strings
 * @ingroup haul-utils
 */
namespace haul {

// ---------------------------------------------------------------------------------- To Upper/Lower
/**
 * @ingroup haul-strings
 * @brief copies and converts `s` to lowercase
 */
inline std::string to_lower_copy(std::string_view s) {
  std::string t{s};
  for (auto& c : t)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return t;
}

// ----------------------------------------------------------------------------------------- explode

template <typename Container = std::vector<std::string_view>>
inline Container explode(std::string_view input, char delim) {
  Container out;
  auto start = std::begin(input);

  std::string_view::size_type pos0 = 0;
  while (true) {
    auto pos1 = input.find_first_of(delim, pos0);
    auto len = (pos1 == std::string_view::npos) ? input.size() - pos0 : pos1 - pos0;
    out.emplace_back(start + pos0, len);
    if (pos1 == std::string_view::npos) {
      break;
    }
    pos0 = pos1 + 1;
  }

  return out;
}

// -------------------------------------------------------------------------------------------- Trim

/** @brief `s` without leading or trailing whitespace */
std::string_view trim_view(std::string_view s);

inline std::string trim_copy(std::string_view s) { return std::string{trim_view(s)}; }

// --------------------------------------------------------------------- Pretty Printing binary data

/**
 * @ingroup haul-strings
 * @brief The raw hex string of `data`, as if via the shell command `xxd`. Used to log
 * frames that fail to decode.
 */
std::string str(std::span<const std::byte> data);

} // namespace haul
