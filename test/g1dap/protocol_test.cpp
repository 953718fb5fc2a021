#include <doctest/doctest.h>

#include "g1dap/dap/protocol.hpp"

using namespace g1dap;
using dap::json;

TEST_CASE("g1dap protocol decodes requests") {
  dap::request request;
  auto parsed = dap::parse_request(
      json{{"seq", 4}, {"type", "request"}, {"command", "next"}, {"arguments", {{"threadId", 2}}}}, request
  );
  REQUIRE(parsed);
  CHECK(request.seq == 4);
  CHECK(request.command == "next");
  CHECK(request.arguments["threadId"] == 2);

  dap::request no_args;
  REQUIRE(dap::parse_request(json{{"seq", 5}, {"type", "request"}, {"command", "threads"}}, no_args));
  CHECK(no_args.arguments.is_object());
  CHECK(no_args.arguments.empty());
}

TEST_CASE("g1dap protocol rejects malformed requests") {
  dap::request request;
  CHECK(dap::parse_request(json::array(), request).code == error_code::protocol_error);
  CHECK_FALSE(dap::parse_request(json{{"seq", 1}, {"type", "event"}, {"event", "x"}}, request));
  CHECK_FALSE(dap::parse_request(json{{"seq", 1}, {"type", "request"}}, request));
  CHECK_FALSE(dap::parse_request(json{{"seq", "one"}, {"type", "request"}, {"command", "next"}}, request));
}

TEST_CASE("g1dap protocol encodes responses and events") {
  dap::request request;
  request.seq = 9;
  request.command = "threads";

  auto ok = dap::to_json(dap::make_response(request, {{"threads", json::array()}}), 3);
  CHECK(ok["seq"] == 3);
  CHECK(ok["type"] == "response");
  CHECK(ok["request_seq"] == 9);
  CHECK(ok["command"] == "threads");
  CHECK(ok["success"] == true);
  CHECK(ok["body"]["threads"].is_array());

  auto failed = dap::to_json(dap::make_error_response(request, "no debugger is running"), 4);
  CHECK(failed["success"] == false);
  CHECK(failed["message"] == "no debugger is running");
  CHECK(failed["body"]["error"]["format"] == "no debugger is running");
  CHECK(failed["body"]["error"]["showUser"] == true);

  auto stopped = dap::to_json(dap::make_stopped_event("breakpoint", 1), 5);
  CHECK(stopped["type"] == "event");
  CHECK(stopped["event"] == "stopped");
  CHECK(stopped["body"]["reason"] == "breakpoint");
  CHECK(stopped["body"]["threadId"] == 1);

  auto initialized = dap::to_json(dap::make_initialized_event(), 6);
  CHECK(initialized["event"] == "initialized");
  CHECK_FALSE(initialized.contains("body"));
}

TEST_CASE("g1dap protocol launch and attach arguments") {
  dap::launch_arguments launch;
  REQUIRE(dap::parse_arguments(
      json{{"program", "/bin/app"}, {"args", {"a", 2}}, {"trace", true}, {"stopOnEntry", true}}, launch
  ));
  CHECK(launch.program == "/bin/app");
  CHECK(launch.args == std::vector<std::string>{"a", "2"});
  CHECK(launch.trace);
  CHECK(launch.stop_on_entry);

  auto missing = dap::parse_arguments(json::object(), launch);
  CHECK(missing.code == error_code::invalid_argument);
  CHECK(missing.error_message.find("program") != std::string::npos);

  CHECK_FALSE(dap::parse_arguments(json{{"program", "/bin/app"}, {"trace", "yes"}}, launch));

  dap::attach_arguments attach;
  REQUIRE(dap::parse_arguments(json{{"program", 1234}}, attach));
  CHECK(attach.program == "1234");
  REQUIRE(dap::parse_arguments(json{{"program", "5678"}, {"debugger", "gdb-multiarch"}}, attach));
  CHECK(attach.program == "5678");
  CHECK(attach.debugger == "gdb-multiarch");
}

TEST_CASE("g1dap protocol setBreakpoints arguments") {
  json bp = {{"line", 10}, {"condition", "x == 1"}, {"hitCondition", "3"}, {"column", 4}};
  dap::set_breakpoints_arguments args;
  REQUIRE(dap::parse_arguments(json{{"source", {{"path", "/src/a.c"}}}, {"breakpoints", json::array({bp})}}, args));
  CHECK(args.source_path == "/src/a.c");
  REQUIRE(args.breakpoints.size() == 1);
  CHECK(args.breakpoints[0].line == 10);
  CHECK(args.breakpoints[0].column == 4);
  CHECK(args.breakpoints[0].condition == "x == 1");
  CHECK(args.breakpoints[0].hit_condition == "3");

  dap::set_breakpoints_arguments legacy;
  REQUIRE(dap::parse_arguments(json{{"source", {{"path", "/src/a.c"}}}, {"lines", {3, 4}}}, legacy));
  REQUIRE(legacy.breakpoints.size() == 2);
  CHECK(legacy.breakpoints[1].line == 4);

  dap::set_breakpoints_arguments none;
  REQUIRE(dap::parse_arguments(json{{"source", {{"path", "/src/a.c"}}}}, none));
  CHECK(none.breakpoints.empty());
}

TEST_CASE("g1dap protocol small argument sets") {
  dap::thread_arguments thread;
  REQUIRE(dap::parse_arguments(json{{"threadId", 3}}, thread));
  CHECK(thread.thread_id == 3u);
  REQUIRE(dap::parse_arguments(json{{"threadId", 0}}, thread));
  CHECK_FALSE(thread.thread_id.has_value());

  dap::evaluate_arguments evaluate;
  REQUIRE(dap::parse_arguments(json{{"expression", "x"}, {"frameId", 2}, {"context", "hover"}}, evaluate));
  CHECK(evaluate.expression == "x");
  CHECK(evaluate.frame_id == 2);
  CHECK(evaluate.context == "hover");

  dap::variables_arguments variables;
  CHECK_FALSE(dap::parse_arguments(json::object(), variables));
  REQUIRE(dap::parse_arguments(json{{"variablesReference", 1000}}, variables));
  CHECK(variables.variables_reference == 1000);

  dap::set_variable_arguments set;
  CHECK_FALSE(dap::parse_arguments(json{{"variablesReference", 1000}, {"value", "1"}}, set));
  REQUIRE(dap::parse_arguments(json{{"variablesReference", 1000}, {"name", "x"}, {"value", "1"}}, set));
  CHECK(set.name == "x");
  CHECK(set.value == "1");
}
