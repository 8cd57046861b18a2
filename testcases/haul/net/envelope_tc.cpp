#include "stdinc.hpp"

#include "haul/net/envelope.hpp"

#include <catch2/catch_all.hpp>

namespace haul::net::tests {

using rpc::Event;
using rpc::Fault;
using rpc::FaultKind;
using rpc::Request;
using rpc::Response;
using rpc::Value;

static BufferType bytes(std::initializer_list<int> values) {
  BufferType buffer;
  for (auto x : values)
    buffer.push_back(std::byte(x));
  return buffer;
}

static std::error_code decode_error(const BufferType& buffer) {
  auto result = decode_envelope(to_span_bytes(buffer));
  return result ? std::error_code{} : result.error();
}

CATCH_TEST_CASE("Envelope", "[envelope]") {
  CATCH_SECTION("request") {
    const Request request{77, "job.add", {"http://example.com/a.iso"},
                          Value::Dict{{"destination", "a.iso"}, {"priority", 2.5}}};
    BufferType buffer;
    CATCH_REQUIRE(encode(buffer, request));
    CATCH_REQUIRE(buffer.size() > 2);
    CATCH_REQUIRE(buffer[0] == std::byte{k_protocol_version});
    CATCH_REQUIRE(buffer[1] == std::byte(EnvelopeType::REQUEST));

    auto decoded = decode_envelope(to_span_bytes(buffer));
    CATCH_REQUIRE(decoded.has_value());
    const auto* out = std::get_if<Request>(&*decoded);
    CATCH_REQUIRE(out != nullptr);
    CATCH_REQUIRE(out->request_id == 77);
    CATCH_REQUIRE(out->operation == "job.add");
    CATCH_REQUIRE(out->args == request.args);
    CATCH_REQUIRE(out->kwargs == request.kwargs);
  }

  CATCH_SECTION("fault response carries no result") {
    const auto response =
        Response::failure(5, Fault{FaultKind::AUTH_ERROR, "insufficient level", "needs admin"});
    BufferType buffer;
    CATCH_REQUIRE(encode(buffer, response));
    auto decoded = decode_envelope(to_span_bytes(buffer));
    CATCH_REQUIRE(decoded.has_value());
    const auto& out = std::get<Response>(*decoded);
    CATCH_REQUIRE(out.request_id == 5);
    CATCH_REQUIRE(!out.ok());
    CATCH_REQUIRE(out.fault == response.fault);
    CATCH_REQUIRE(out.result.is_null());
  }

  CATCH_SECTION("event") {
    const auto event = Event::make("job.status", Value::Dict{{"id", 1}, {"progress", 50}});
    CATCH_REQUIRE(event.timestamp_micros > 0);
    BufferType buffer;
    CATCH_REQUIRE(encode(buffer, event));
    auto decoded = decode_envelope(to_span_bytes(buffer));
    CATCH_REQUIRE(decoded.has_value());
    const auto& out = std::get<Event>(*decoded);
    CATCH_REQUIRE(out.name == "job.status");
    CATCH_REQUIRE(out.payload == event.payload);
    CATCH_REQUIRE(out.timestamp_micros == event.timestamp_micros);
  }

  CATCH_SECTION("malformed frames") {
    CATCH_REQUIRE(decode_error({}) == make_error_code(ecode::buffer_underflow));
    CATCH_REQUIRE(decode_error(bytes({2, 1})) == make_error_code(ecode::version_mismatch));
    CATCH_REQUIRE(decode_error(bytes({1, 9})) == make_error_code(ecode::invalid_data));

    BufferType buffer;
    CATCH_REQUIRE(encode(buffer, Request{1, "daemon.info", {}, {}}));

    auto truncated = buffer;
    truncated.pop_back();
    CATCH_REQUIRE(decode_error(truncated) == make_error_code(ecode::buffer_underflow));

    auto trailing = buffer;
    trailing.push_back(std::byte{0});
    CATCH_REQUIRE(decode_error(trailing) == make_error_code(ecode::trailing_data));
  }

  CATCH_SECTION("a response with an unknown fault kind is invalid") {
    // version, type, request-id, fault-kind
    const auto buffer = bytes({1, 2, 0, 0, 0, 0, 0, 0, 0, 1, 200});
    CATCH_REQUIRE(decode_error(buffer) == make_error_code(ecode::invalid_data));
  }

  CATCH_SECTION("duplicate dictionary keys are invalid") {
    // dict of 2: "a" => null, "a" => null
    const auto buffer = bytes({7, 0, 0, 0, 2, 0, 0, 0, 1, 'a', 0, 0, 0, 0, 1, 'a', 0});
    auto decoded = decode_value(to_span_bytes(buffer));
    CATCH_REQUIRE(!decoded.has_value());
    CATCH_REQUIRE(decoded.error() == make_error_code(ecode::invalid_data));
  }

  CATCH_SECTION("strings are written as a length then their bytes") {
    BufferType buffer;
    CATCH_REQUIRE(encode_value(buffer, Value{"haul"}));
    CATCH_REQUIRE(buffer == bytes({5, 0, 0, 0, 4, 'h', 'a', 'u', 'l'}));

    buffer.clear();
    CATCH_REQUIRE(encode_value(buffer, Value{""}));
    CATCH_REQUIRE(buffer == bytes({5, 0, 0, 0, 0}));
  }

  CATCH_SECTION("an element count larger than the frame is rejected before allocating") {
    const auto buffer = bytes({6, 0, 0, 0, 5, 0, 0});
    auto decoded = decode_value(to_span_bytes(buffer));
    CATCH_REQUIRE(!decoded.has_value());
    CATCH_REQUIRE(decoded.error() == make_error_code(ecode::buffer_underflow));
  }

  CATCH_SECTION("container sizes are capped") {
    const auto count = uint32_t(k_max_container_size + 1);
    for (auto tag : {6, 7}) {
      const auto buffer = bytes({tag, int(count >> 24), int((count >> 16) & 0xff),
                                 int((count >> 8) & 0xff), int(count & 0xff)});
      auto decoded = decode_value(to_span_bytes(buffer));
      CATCH_REQUIRE(!decoded.has_value());
      CATCH_REQUIRE(decoded.error() == make_error_code(ecode::object_too_large));
    }

    const auto too_many = bytes({6, 0xff, 0xff, 0xff, 0xff});
    CATCH_REQUIRE(decode_value(to_span_bytes(too_many)).error()
                  == make_error_code(ecode::object_too_large));

    BufferType buffer;
    CATCH_REQUIRE(!encode_value(buffer, Value{Value::List(k_max_container_size + 1)}));
  }

  CATCH_SECTION("nesting is limited") {
    Value deep = Value::List{};
    for (std::size_t i = 0; i < k_max_value_depth + 1; ++i)
      deep = Value::List{deep};
    BufferType buffer;
    CATCH_REQUIRE(!encode_value(buffer, deep));

    // Hand-build the same nesting on the wire
    BufferType wire;
    for (std::size_t i = 0; i < k_max_value_depth + 2; ++i)
      for (auto x : {6, 0, 0, 0, 1})
        wire.push_back(std::byte(x));
    wire.push_back(std::byte{0});
    auto decoded = decode_value(to_span_bytes(wire));
    CATCH_REQUIRE(!decoded.has_value());
    CATCH_REQUIRE(decoded.error() == make_error_code(ecode::nesting_too_deep));
  }
}

} // namespace haul::net::tests
