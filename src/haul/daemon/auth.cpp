
#include "auth.hpp"

#include "haul/utils/string-utils.hpp"

#include <openssl/crypto.h>

#include <charconv>
#include <fstream>

namespace haul {

std::optional<AuthLevel> parse_auth_level(std::string_view text) {
  const auto s = to_lower_copy(trim_copy(text));
  for (const auto level :
       {AuthLevel::NONE, AuthLevel::READ_ONLY, AuthLevel::STANDARD, AuthLevel::ADMIN}) {
    if (s == str(level))
      return level;
  }

  int value = -1;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    return std::nullopt;

  switch (value) {
  case int(AuthLevel::NONE): return AuthLevel::NONE;
  case int(AuthLevel::READ_ONLY): return AuthLevel::READ_ONLY;
  case int(AuthLevel::STANDARD): return AuthLevel::STANDARD;
  case int(AuthLevel::ADMIN): return AuthLevel::ADMIN;
  }
  return std::nullopt;
}

// --------------------------------------------------------------------------------------- AuthTable

expected<AuthTable, string> AuthTable::parse(std::string_view text) {
  AuthTable table;
  std::size_t line_no = 0;
  for (const auto raw_line : explode(text, '\n')) {
    ++line_no;
    const auto line = trim_copy(raw_line);
    if (line.empty() || line[0] == '#')
      continue;

    // The password may contain ':', so split on the first and last
    const auto first = line.find(':');
    const auto last = line.rfind(':');
    if (first == string::npos || first == last)
      return make_unexpected(format("line {}: expected 'username:password:level'", line_no));

    const auto username = trim_copy(std::string_view{line}.substr(0, first));
    const auto password = line.substr(first + 1, last - first - 1);
    const auto level = parse_auth_level(std::string_view{line}.substr(last + 1));
    if (username.empty())
      return make_unexpected(format("line {}: empty username", line_no));
    if (!level)
      return make_unexpected(
          format("line {}: invalid level '{}'", line_no, line.substr(last + 1)));

    table.add(username, password, *level);
  }
  return table;
}

expected<AuthTable, string> AuthTable::load(const std::filesystem::path& filename) {
  std::ifstream in{filename, std::ios::in | std::ios::binary};
  if (!in.is_open())
    return make_unexpected(format("failed to open auth file '{}'", filename.string()));
  std::stringstream ss;
  ss << in.rdbuf();
  auto table = parse(ss.str());
  if (!table)
    return make_unexpected(format("{}: {}", filename.string(), table.error()));
  return table;
}

void AuthTable::add(string username, string password, AuthLevel level) {
  entries_.insert_or_assign(std::move(username), Entry{std::move(password), level});
}

std::optional<AuthLevel> AuthTable::check(const Credentials& credentials) const {
  auto ii = entries_.find(credentials.username);
  if (ii == cend(entries_))
    return std::nullopt;
  const auto& expected_password = ii->second.password;
  if (expected_password.size() != credentials.password.size())
    return std::nullopt;
  if (CRYPTO_memcmp(expected_password.data(), credentials.password.data(),
                    expected_password.size()) != 0)
    return std::nullopt;
  return ii->second.level;
}

} // namespace haul
