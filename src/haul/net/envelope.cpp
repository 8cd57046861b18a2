
#include "envelope.hpp"

#include <boost/endian/conversion.hpp>

#include <bit>
#include <cstring>
#include <limits>

namespace haul::net {

using rpc::Event;
using rpc::Fault;
using rpc::FaultKind;
using rpc::Request;
using rpc::Response;
using rpc::Value;

namespace {

  enum class ValueTag : uint8_t {
    NIL = 0,
    FALSE_ = 1,
    TRUE_ = 2,
    INT = 3,
    DOUBLE = 4,
    STRING = 5,
    LIST = 6,
    DICT = 7
  };

  // -------------------------------------------------------------------------------------- Encoders

  template <typename T> void encode_integer(BufferType& buffer, T value) {
    boost::endian::native_to_big_inplace(value);
    const auto offset = buffer.size();
    buffer.resize(offset + sizeof(T));
    std::memcpy(&buffer[offset], &value, sizeof(T));
  }

  bool encode_string_view(BufferType& buffer, std::string_view data) {
    if (data.size() > std::numeric_limits<uint32_t>::max())
      return false;
    encode_integer(buffer, uint32_t(data.size()));
    buffer << data;
    return true;
  }

  bool encode_value_(BufferType& buffer, const Value& value, std::size_t depth) {
    if (depth > k_max_value_depth)
      return false;

    switch (value.type()) {
    case Value::Type::NIL: encode_integer(buffer, uint8_t(ValueTag::NIL)); return true;
    case Value::Type::BOOL:
      encode_integer(buffer, uint8_t(value.as_bool() ? ValueTag::TRUE_ : ValueTag::FALSE_));
      return true;
    case Value::Type::INT:
      encode_integer(buffer, uint8_t(ValueTag::INT));
      encode_integer(buffer, value.as_int());
      return true;
    case Value::Type::DOUBLE:
      encode_integer(buffer, uint8_t(ValueTag::DOUBLE));
      encode_integer(buffer, std::bit_cast<uint64_t>(value.as_double()));
      return true;
    case Value::Type::STRING:
      encode_integer(buffer, uint8_t(ValueTag::STRING));
      return encode_string_view(buffer, value.as_string());
    case Value::Type::LIST: {
      const auto& list = value.as_list();
      if (list.size() > k_max_container_size)
        return false;
      encode_integer(buffer, uint8_t(ValueTag::LIST));
      encode_integer(buffer, uint32_t(list.size()));
      for (const auto& item : list)
        if (!encode_value_(buffer, item, depth + 1))
          return false;
      return true;
    }
    case Value::Type::DICT: {
      const auto& dict = value.as_dict();
      if (dict.size() > k_max_container_size)
        return false;
      encode_integer(buffer, uint8_t(ValueTag::DICT));
      encode_integer(buffer, uint32_t(dict.size()));
      for (const auto& [key, item] : dict)
        if (!encode_string_view(buffer, key) || !encode_value_(buffer, item, depth + 1))
          return false;
      return true;
    }
    }
    return false;
  }

  void encode_header(BufferType& buffer, EnvelopeType type) {
    buffer.clear();
    encode_integer(buffer, k_protocol_version);
    encode_integer(buffer, uint8_t(type));
  }

  // -------------------------------------------------------------------------------------- Decoders

  class Reader {
  private:
    std::span<const std::byte> data_;
    std::size_t position_{0};

  public:
    explicit Reader(std::span<const std::byte> data) : data_{data} {}

    std::size_t remaining() const { return data_.size() - position_; }

    template <typename T> error_code integer(T& value) {
      if (remaining() < sizeof(T))
        return make_error_code(ecode::buffer_underflow);
      std::memcpy(&value, data_.data() + position_, sizeof(T));
      boost::endian::big_to_native_inplace(value);
      position_ += sizeof(T);
      return {};
    }

    error_code string(std::string& value) {
      uint32_t length = 0;
      if (auto ec = integer(length))
        return ec;
      if (remaining() < length)
        return make_error_code(ecode::buffer_underflow);
      value.assign(reinterpret_cast<const char*>(data_.data() + position_), length);
      position_ += length;
      return {};
    }

    /// Every element occupies at least one byte, so `count` is bounded by what is left
    error_code element_count(uint32_t& count) {
      if (auto ec = integer(count))
        return ec;
      if (count > k_max_container_size)
        return make_error_code(ecode::object_too_large);
      if (count > remaining())
        return make_error_code(ecode::buffer_underflow);
      return {};
    }
  };

  error_code decode_value_(Reader& reader, Value& value, std::size_t depth) {
    if (depth > k_max_value_depth)
      return make_error_code(ecode::nesting_too_deep);

    uint8_t tag = 0;
    if (auto ec = reader.integer(tag))
      return ec;

    switch (ValueTag(tag)) {
    case ValueTag::NIL: value = Value{}; return {};
    case ValueTag::FALSE_: value = Value{false}; return {};
    case ValueTag::TRUE_: value = Value{true}; return {};
    case ValueTag::INT: {
      int64_t x = 0;
      if (auto ec = reader.integer(x))
        return ec;
      value = Value{x};
      return {};
    }
    case ValueTag::DOUBLE: {
      uint64_t bits = 0;
      if (auto ec = reader.integer(bits))
        return ec;
      value = Value{std::bit_cast<double>(bits)};
      return {};
    }
    case ValueTag::STRING: {
      std::string s;
      if (auto ec = reader.string(s))
        return ec;
      value = Value{std::move(s)};
      return {};
    }
    case ValueTag::LIST: {
      uint32_t count = 0;
      if (auto ec = reader.element_count(count))
        return ec;
      Value::List list;
      for (uint32_t i = 0; i < count; ++i) {
        Value item;
        if (auto ec = decode_value_(reader, item, depth + 1))
          return ec;
        list.push_back(std::move(item));
      }
      value = Value{std::move(list)};
      return {};
    }
    case ValueTag::DICT: {
      uint32_t count = 0;
      if (auto ec = reader.element_count(count))
        return ec;
      Value::Dict dict;
      for (uint32_t i = 0; i < count; ++i) {
        std::string key;
        Value item;
        if (auto ec = reader.string(key))
          return ec;
        if (auto ec = decode_value_(reader, item, depth + 1))
          return ec;
        if (!dict.emplace(std::move(key), std::move(item)).second)
          return make_error_code(ecode::invalid_data); // duplicate key
      }
      value = Value{std::move(dict)};
      return {};
    }
    }
    return make_error_code(ecode::invalid_data);
  }

  error_code decode_list(Reader& reader, Value::List& list) {
    Value value;
    if (auto ec = decode_value_(reader, value, 0))
      return ec;
    if (!value.is_list())
      return make_error_code(ecode::invalid_data);
    list = std::move(value.as_list());
    return {};
  }

  error_code decode_dict(Reader& reader, Value::Dict& dict) {
    Value value;
    if (auto ec = decode_value_(reader, value, 0))
      return ec;
    if (!value.is_dict())
      return make_error_code(ecode::invalid_data);
    dict = std::move(value.as_dict());
    return {};
  }

  error_code decode_payload(Reader& reader, Request& request) {
    if (auto ec = reader.integer(request.request_id))
      return ec;
    if (auto ec = reader.string(request.operation))
      return ec;
    if (auto ec = decode_list(reader, request.args))
      return ec;
    return decode_dict(reader, request.kwargs);
  }

  error_code decode_payload(Reader& reader, Response& response) {
    uint8_t kind = 0;
    if (auto ec = reader.integer(response.request_id))
      return ec;
    if (auto ec = reader.integer(kind))
      return ec;
    if (kind >= uint8_t(FaultKind::DO_NOT_USE))
      return make_error_code(ecode::invalid_data);
    if (FaultKind(kind) == FaultKind::OK) {
      response.fault = Fault{};
      return decode_value_(reader, response.result, 0);
    }
    std::string message, details;
    if (auto ec = reader.string(message))
      return ec;
    if (auto ec = reader.string(details))
      return ec;
    response.fault = Fault{FaultKind(kind), std::move(message), std::move(details)};
    return {};
  }

  error_code decode_payload(Reader& reader, Event& event) {
    if (auto ec = reader.string(event.name))
      return ec;
    if (auto ec = decode_value_(reader, event.payload, 0))
      return ec;
    return reader.integer(event.timestamp_micros);
  }

  template <typename T>
  tl::expected<Envelope, std::error_code> decode_as(Reader& reader) {
    T message;
    if (auto ec = decode_payload(reader, message))
      return tl::make_unexpected(ec);
    if (reader.remaining() != 0)
      return tl::make_unexpected(make_error_code(ecode::trailing_data));
    return Envelope{std::move(message)};
  }

} // namespace

// ------------------------------------------------------------------------------------------ encode

bool encode(BufferType& buffer, const Request& request) {
  encode_header(buffer, EnvelopeType::REQUEST);
  encode_integer(buffer, request.request_id);
  return encode_string_view(buffer, request.operation)        // If any
         && encode_value_(buffer, Value{request.args}, 0)     // encode
         && encode_value_(buffer, Value{request.kwargs}, 0);  // fails, then false
}

bool encode(BufferType& buffer, const Response& response) {
  encode_header(buffer, EnvelopeType::RESPONSE);
  encode_integer(buffer, response.request_id);
  encode_integer(buffer, uint8_t(response.fault.kind()));
  if (response.ok())
    return encode_value_(buffer, response.result, 0);
  return encode_string_view(buffer, response.fault.message())
         && encode_string_view(buffer, response.fault.details());
}

bool encode(BufferType& buffer, const Event& event) {
  encode_header(buffer, EnvelopeType::EVENT);
  if (!encode_string_view(buffer, event.name) || !encode_value_(buffer, event.payload, 0))
    return false;
  encode_integer(buffer, event.timestamp_micros);
  return true;
}

bool encode_value(BufferType& buffer, const Value& value) {
  return encode_value_(buffer, value, 0);
}

// ------------------------------------------------------------------------------------------ decode

tl::expected<Envelope, std::error_code> decode_envelope(std::span<const std::byte> payload) {
  Reader reader{payload};
  uint8_t version = 0;
  uint8_t type = 0;
  if (auto ec = reader.integer(version))
    return tl::make_unexpected(ec);
  if (version != k_protocol_version)
    return tl::make_unexpected(make_error_code(ecode::version_mismatch));
  if (auto ec = reader.integer(type))
    return tl::make_unexpected(ec);

  switch (EnvelopeType(type)) {
  case EnvelopeType::REQUEST: return decode_as<Request>(reader);
  case EnvelopeType::RESPONSE: return decode_as<Response>(reader);
  case EnvelopeType::EVENT: return decode_as<Event>(reader);
  }
  return tl::make_unexpected(make_error_code(ecode::invalid_data));
}

tl::expected<Value, std::error_code> decode_value(std::span<const std::byte> payload) {
  Reader reader{payload};
  Value value;
  if (auto ec = decode_value_(reader, value, 0))
    return tl::make_unexpected(ec);
  if (reader.remaining() != 0)
    return tl::make_unexpected(make_error_code(ecode::trailing_data));
  return value;
}

} // namespace haul::net
