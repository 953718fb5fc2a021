#include <doctest/doctest.h>

#include <sstream>

#include "g1dap/dap/transport.hpp"

using namespace g1dap;

namespace {

std::string frame(const std::string& body) { return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body; }

} // namespace

TEST_CASE("g1dap transport reads consecutive framed messages") {
  std::istringstream in(frame(R"({"seq":1})") + "Content-Type: application/json\r\n" + frame(R"({"seq":2})"));
  std::ostringstream out;
  dap::transport wire(in, out);

  std::string payload;
  REQUIRE(wire.read(payload));
  CHECK(payload == R"({"seq":1})");
  REQUIRE(wire.read(payload));
  CHECK(payload == R"({"seq":2})");

  auto end = wire.read(payload);
  CHECK_FALSE(end);
  CHECK(wire.eof());
}

TEST_CASE("g1dap transport accepts bare newlines and any header case") {
  std::istringstream in("content-length: 2\n\n{}");
  std::ostringstream out;
  dap::transport wire(in, out);

  std::string payload;
  REQUIRE(wire.read(payload));
  CHECK(payload == "{}");
}

TEST_CASE("g1dap transport reports framing errors") {
  std::ostringstream out;
  std::string payload;

  std::istringstream no_length("X-Other: 1\r\n\r\n{}");
  dap::transport missing(no_length, out);
  auto status = missing.read(payload);
  CHECK(status.code == error_code::protocol_error);
  CHECK_FALSE(missing.eof());

  std::istringstream bad_length("Content-Length: ten\r\n\r\n{}");
  dap::transport bad(bad_length, out);
  CHECK(bad.read(payload).code == error_code::protocol_error);

  std::istringstream huge_length("Content-Length: 999999999999\r\n\r\n{}");
  dap::transport huge(huge_length, out);
  CHECK(huge.read(payload).code == error_code::protocol_error);

  std::istringstream truncated("Content-Length: 20\r\n\r\n{}");
  dap::transport shortened(truncated, out);
  CHECK(shortened.read(payload).code == error_code::io_error);
  CHECK(shortened.eof());
}

TEST_CASE("g1dap transport writes framed json") {
  std::istringstream in;
  std::ostringstream out;
  dap::transport wire(in, out);

  REQUIRE(wire.write(dap::json{{"seq", 1}}));
  CHECK(out.str() == frame(R"({"seq":1})"));
}
