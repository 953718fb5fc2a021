#include <doctest/doctest.h>

#include <sstream>
#include <vector>

#include "g1dap/dap/server.hpp"
#include "g1dap/session/session_controller.hpp"

using namespace g1dap;

namespace {

std::string frame(const std::string& body) { return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body; }

std::vector<dap::json> read_all(const std::string& text) {
  std::istringstream in(text);
  std::ostringstream unused;
  dap::transport wire(in, unused);

  std::vector<dap::json> messages;
  std::string payload;
  while (wire.read(payload)) {
    messages.push_back(dap::json::parse(payload));
  }
  return messages;
}

} // namespace

TEST_CASE("g1dap server feeds requests to the session and numbers replies") {
  std::istringstream in(
      frame(R"({"seq":1,"type":"request","command":"initialize","arguments":{"adapterID":"g1dap"}})") +
      frame("{not json") + frame(R"({"seq":2,"type":"event","event":"ignored"})") +
      frame(R"({"seq":3,"type":"request","command":"threads"})")
  );
  std::ostringstream out;
  dap::transport wire(in, out);
  dap::server client(wire);

  session::session_controller controller(session::session_controller::config{}, client);
  client.serve_requests(controller);
  while (controller.dispatch_next()) {
  }

  auto messages = read_all(out.str());
  REQUIRE(messages.size() == 3);

  CHECK(messages[0]["type"] == "response");
  CHECK(messages[0]["command"] == "initialize");
  CHECK(messages[0]["request_seq"] == 1);
  CHECK(messages[0]["seq"] == 1);

  CHECK(messages[1]["type"] == "event");
  CHECK(messages[1]["event"] == "initialized");
  CHECK(messages[1]["seq"] == 2);

  CHECK(messages[2]["command"] == "threads");
  CHECK(messages[2]["request_seq"] == 3);
  CHECK(messages[2]["success"] == false);
  CHECK(messages[2]["seq"] == 3);
}

TEST_CASE("g1dap server shows errors as important output") {
  std::istringstream in;
  std::ostringstream out;
  dap::transport wire(in, out);
  dap::server client(wire);

  client.show_error("debugger exited unexpectedly");

  auto messages = read_all(out.str());
  REQUIRE(messages.size() == 1);
  CHECK(messages[0]["event"] == "output");
  CHECK(messages[0]["body"]["category"] == "important");
  CHECK(messages[0]["body"]["output"] == "debugger exited unexpectedly\n");
}
