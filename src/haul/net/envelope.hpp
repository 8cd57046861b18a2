#pragma once

#include "buffer.hpp"

#include "haul/rpc/message.hpp"
#include "haul/utils/error-codes.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <span>
#include <variant>

namespace haul::net {

/**
 * @brief Wire format.
 *
 * Every websocket message is exactly one envelope, sent in network byte order:
 *
 * ~~~~~~~~~~~~~~~~~~~~~~
 * envelope := u8 version, u8 type, payload
 * request  := u64 request-id, string operation, list args, dict kwargs
 * response := u64 request-id, u8 fault-kind, (value | string message, string details)
 * event    := string name, value payload, i64 timestamp-micros
 * string   := u32 length, bytes
 * value    := u8 tag, ...
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
constexpr uint8_t k_protocol_version = 1;

/** @brief Values nested deeper than this are rejected */
constexpr std::size_t k_max_value_depth = 64;

/** @brief Lists and dicts with more elements than this are rejected */
constexpr std::size_t k_max_container_size = 1 << 20;

enum class EnvelopeType : uint8_t { REQUEST = 1, RESPONSE = 2, EVENT = 3 };

using Envelope = std::variant<rpc::Request, rpc::Response, rpc::Event>;

/**
 * @return false iff there's an error encoding the data
 */
bool encode(BufferType& buffer, const rpc::Request& request);
bool encode(BufferType& buffer, const rpc::Response& response);
bool encode(BufferType& buffer, const rpc::Event& event);

/**
 * @brief Decode exactly one envelope, which must span all of `payload`
 */
tl::expected<Envelope, std::error_code> decode_envelope(std::span<const std::byte> payload);

/**
 * @brief Append a single value to `buffer`
 * @return false iff there's an error encoding the data
 */
bool encode_value(BufferType& buffer, const rpc::Value& value);

/**
 * @brief Decode a single value that spans all of `payload`
 */
tl::expected<rpc::Value, std::error_code> decode_value(std::span<const std::byte> payload);

} // namespace haul::net
