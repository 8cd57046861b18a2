#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace haul::rpc {

/**
 * @brief A dynamically typed value; the argument and result type of every operation, and
 * the payload of every event.
 *
 * The accessors (`as_string()` etc.) throw `std::invalid_argument` on a type mismatch.
 * Inside an operation handler that surfaces as a `HANDLER_ERROR` fault.
 */
class Value {
public:
  using List = std::vector<Value>;
  using Dict = std::map<std::string, Value, std::less<>>;

  enum class Type : uint8_t { NIL = 0, BOOL, INT, DOUBLE, STRING, LIST, DICT };

private:
  std::variant<std::monostate, bool, int64_t, double, std::string, List, Dict> data_{};

  [[noreturn]] void throw_type_error_(Type expected) const;

public:
  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool x) : data_{x} {}
  template <typename T>
  requires(std::is_integral_v<T> && !std::is_same_v<T, bool>) Value(T x)
      : data_{static_cast<int64_t>(x)} {}
  Value(double x) : data_{x} {}
  Value(const char* s) : data_{std::string{s}} {}
  Value(std::string s) : data_{std::move(s)} {}
  Value(std::string_view s) : data_{std::string{s}} {}
  Value(List x) : data_{std::move(x)} {}
  Value(Dict x) : data_{std::move(x)} {}

  Type type() const { return static_cast<Type>(data_.index()); }

  bool is_null() const { return type() == Type::NIL; }
  bool is_bool() const { return type() == Type::BOOL; }
  bool is_int() const { return type() == Type::INT; }
  bool is_double() const { return type() == Type::DOUBLE; }
  bool is_string() const { return type() == Type::STRING; }
  bool is_list() const { return type() == Type::LIST; }
  bool is_dict() const { return type() == Type::DICT; }

  bool as_bool() const {
    if (!is_bool())
      throw_type_error_(Type::BOOL);
    return std::get<bool>(data_);
  }

  int64_t as_int() const {
    if (!is_int())
      throw_type_error_(Type::INT);
    return std::get<int64_t>(data_);
  }

  /** @brief Integers are promoted */
  double as_double() const {
    if (is_int())
      return static_cast<double>(std::get<int64_t>(data_));
    if (!is_double())
      throw_type_error_(Type::DOUBLE);
    return std::get<double>(data_);
  }

  const std::string& as_string() const {
    if (!is_string())
      throw_type_error_(Type::STRING);
    return std::get<std::string>(data_);
  }

  const List& as_list() const {
    if (!is_list())
      throw_type_error_(Type::LIST);
    return std::get<List>(data_);
  }

  List& as_list() {
    if (!is_list())
      throw_type_error_(Type::LIST);
    return std::get<List>(data_);
  }

  const Dict& as_dict() const {
    if (!is_dict())
      throw_type_error_(Type::DICT);
    return std::get<Dict>(data_);
  }

  Dict& as_dict() {
    if (!is_dict())
      throw_type_error_(Type::DICT);
    return std::get<Dict>(data_);
  }

  /**
   * @brief Dictionary lookup.
   * @return nullptr if this is not a dictionary, or `key` is absent.
   */
  const Value* find(std::string_view key) const {
    if (!is_dict())
      return nullptr;
    const auto& dict = std::get<Dict>(data_);
    auto ii = dict.find(key);
    return (ii == dict.end()) ? nullptr : &ii->second;
  }

  bool operator==(const Value& o) const { return data_ == o.data_; }
  bool operator!=(const Value& o) const { return !(*this == o); }

  /** @brief A compact, json-like rendering, for logging */
  std::string to_string() const;
};

constexpr std::string_view str(Value::Type type) {
  switch (type) {
  case Value::Type::NIL: return "null";
  case Value::Type::BOOL: return "bool";
  case Value::Type::INT: return "int";
  case Value::Type::DOUBLE: return "double";
  case Value::Type::STRING: return "string";
  case Value::Type::LIST: return "list";
  case Value::Type::DICT: return "dict";
  }
  return "<unknown type>";
}

inline void Value::throw_type_error_(Type expected) const {
  throw std::invalid_argument(std::string{"expected "} + std::string{str(expected)} + ", got " +
                              std::string{str(type())});
}

} // namespace haul::rpc
