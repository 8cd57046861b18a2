#include "value.hpp"

#include "haul/utils/base-include.hpp"

namespace haul::rpc {

static void append_quoted_(std::string& out, std::string_view s) {
  out.push_back('"');
  for (const auto ch : s) {
    switch (ch) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\t': out += "\\t"; break;
    default: out.push_back(ch);
    }
  }
  out.push_back('"');
}

static void append_value_(std::string& out, const Value& value) {
  switch (value.type()) {
  case Value::Type::NIL: out += "null"; break;
  case Value::Type::BOOL: out += value.as_bool() ? "true" : "false"; break;
  case Value::Type::INT: out += fmt::format("{}", value.as_int()); break;
  case Value::Type::DOUBLE: out += fmt::format("{}", value.as_double()); break;
  case Value::Type::STRING: append_quoted_(out, value.as_string()); break;
  case Value::Type::LIST: {
    out.push_back('[');
    bool first = true;
    for (const auto& item : value.as_list()) {
      if (!first)
        out.push_back(',');
      first = false;
      append_value_(out, item);
    }
    out.push_back(']');
  } break;
  case Value::Type::DICT: {
    out.push_back('{');
    bool first = true;
    for (const auto& [key, item] : value.as_dict()) {
      if (!first)
        out.push_back(',');
      first = false;
      append_quoted_(out, key);
      out.push_back(':');
      append_value_(out, item);
    }
    out.push_back('}');
  } break;
  }
}

std::string Value::to_string() const {
  std::string out;
  append_value_(out, *this);
  return out;
}

} // namespace haul::rpc
