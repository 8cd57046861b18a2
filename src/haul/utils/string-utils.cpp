#include "base-include.hpp"

#include "string-utils.hpp"

#include <cstdio>

namespace haul {
// --------------------------------------------------------------------- Pretty Printing binary data

std::string str(std::span<const std::byte> data) {
  // 0         1         2         3         4         5         6
  // 01234567890123456789012345678901234567890123456789012345678901234567
  // 00000000: 0a23 2050 7974 686f 6e2f 432b 2b20 4d75  .# Python/C++ Mu

  const auto ptr = reinterpret_cast<const unsigned char*>(data.data());
  const auto sz = data.size();

  auto hexit = [](unsigned c) -> char {
    if (c < 10)
      return char('0' + c);
    return char('a' + (c - 10));
  };

  const std::size_t row_sz = 68;
  const auto n_rows = (sz % 16 == 0) ? (sz / 16) : (1 + sz / 16);
  std::string out;
  out.resize(n_rows * row_sz, ' ');

  char buffer[32];
  auto process_row = [&](const std::size_t row_number) {
    const auto row_pos = row_number * row_sz;
    snprintf(buffer, 32, "%08zx:", row_number * 16);
    std::copy(&buffer[0], &buffer[0] + 9, &out[row_pos]);
    auto pos = row_pos + 9;
    auto ascii_pos = row_pos + 51;

    const auto k = row_number * 16;
    for (auto i = k; i < k + 16 && i < sz; ++i) {
      if (i % 2 == 0)
        out[pos++] = ' ';
      const auto c = ptr[i];
      out[pos++] = hexit((c >> 4) & 0x0f);
      out[pos++] = hexit((c >> 0) & 0x0f);
      out[ascii_pos++] = std::isprint(c) ? char(c) : '.';
    }
    out[row_pos + 67] = '\n';
  };

  for (std::size_t row = 0; row < n_rows; ++row)
    process_row(row);

  return out;
}

// -------------------------------------------------------------------------------------------- Trim

std::string_view trim_view(std::string_view s) {
  auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
  while (!s.empty() && is_space(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && is_space(s.back()))
    s.remove_suffix(1);
  return s;
}

} // namespace haul
