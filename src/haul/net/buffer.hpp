#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace haul::net {

/** @brief One encoded message, as it goes over the wire */
using BufferType = std::vector<std::byte>;

inline std::span<const std::byte> to_span_bytes(const BufferType& buffer) {
  return {buffer.data(), buffer.size()};
}

inline BufferType make_send_buffer(std::string_view text) {
  const auto bytes = std::as_bytes(std::span{text.data(), text.size()});
  return BufferType{bytes.begin(), bytes.end()};
}

inline BufferType& operator<<(BufferType& buffer, std::string_view text) {
  const auto bytes = std::as_bytes(std::span{text.data(), text.size()});
  buffer.insert(buffer.end(), bytes.begin(), bytes.end());
  return buffer;
}

} // namespace haul::net
