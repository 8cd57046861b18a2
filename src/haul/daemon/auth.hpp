#pragma once

#include "haul/utils/base-include.hpp"

#include <filesystem>
#include <optional>

namespace haul {

/**
 * @brief Totally ordered permission tiers.
 *
 * The numeric values are the ones used in auth files.
 */
enum class AuthLevel : int { NONE = 0, READ_ONLY = 1, STANDARD = 5, ADMIN = 10 };

constexpr std::string_view str(AuthLevel level) {
  switch (level) {
  case AuthLevel::NONE: return "none";
  case AuthLevel::READ_ONLY: return "read-only";
  case AuthLevel::STANDARD: return "standard";
  case AuthLevel::ADMIN: return "admin";
  }
  return "<unknown level>";
}

/**
 * @brief Parse a level from its name (as returned by `str`) or its number.
 */
std::optional<AuthLevel> parse_auth_level(std::string_view text);

/**
 * @brief An operation registered without a level is unreachable.
 */
constexpr bool is_authorized(AuthLevel session_level, std::optional<AuthLevel> required) {
  return required.has_value() && int(session_level) >= int(*required);
}

struct Credentials {
  string username;
  string password;
};

// --------------------------------------------------------------------------------------- AuthTable

/**
 * @brief The set of known users.
 *
 * The file format is one `username:password:level` entry per line. Blank lines and lines
 * starting with `#` are ignored.
 */
class AuthTable {
private:
  struct Entry {
    string password;
    AuthLevel level = AuthLevel::NONE;
  };
  std::unordered_map<string, Entry> entries_;

public:
  /**
   * @return The table, or a message naming the first malformed line.
   */
  static expected<AuthTable, string> parse(std::string_view text);
  static expected<AuthTable, string> load(const std::filesystem::path& filename);

  /** @brief Add or replace a user */
  void add(string username, string password, AuthLevel level);

  /**
   * @return The level of `credentials.username`, iff the password matches.
   */
  std::optional<AuthLevel> check(const Credentials& credentials) const;

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
};

} // namespace haul
