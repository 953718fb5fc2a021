#include <doctest/doctest.h>

#include "g1dap/session/command_translator.hpp"

using namespace g1dap;
using namespace g1dap::session;

TEST_CASE("g1dap translator renumbers client frames") {
  CHECK(to_engine_frame(5) == 4);
  CHECK(to_engine_frame(1) == 0);
  CHECK_FALSE(to_engine_frame(0).has_value());
  CHECK_FALSE(to_engine_frame(std::nullopt).has_value());
}

TEST_CASE("g1dap translator picks the evaluate path from the context") {
  CHECK(evaluate_mode_for("hover") == evaluate_mode::expression);
  CHECK(evaluate_mode_for("watch") == evaluate_mode::expression);
  CHECK(evaluate_mode_for("repl") == evaluate_mode::console);
  CHECK(evaluate_mode_for("") == evaluate_mode::console);
  CHECK(evaluate_mode_for("clipboard") == evaluate_mode::console);
}

TEST_CASE("g1dap translator total frames is one less than the frame count") {
  CHECK(total_frames(0) == 0);
  CHECK(total_frames(1) == 0);
  CHECK(total_frames(4) == 3);

  std::vector<engine::frame_info> frames(3);
  CHECK(stack_trace_body(frames)["totalFrames"] == 2);
  CHECK(stack_trace_body({})["totalFrames"] == 0);
  CHECK(stack_trace_body({})["stackFrames"].empty());
}

TEST_CASE("g1dap translator fills spawn options") {
  dap::launch_arguments launch;
  launch.program = "/bin/app";
  launch.cwd = "/work";
  launch.args = {"--fast"};

  auto options = to_spawn_options(launch, "gdb");
  CHECK(options.debugger_path == "gdb");
  CHECK(options.target == "/bin/app");
  CHECK(options.cwd == "/work");
  CHECK(options.args.size() == 1);

  launch.debugger = "/usr/local/bin/gdb";
  CHECK(to_spawn_options(launch, "gdb").debugger_path == "/usr/local/bin/gdb");

  dap::attach_arguments attach;
  attach.program = "1234";
  auto attach_options = to_spawn_options(attach, "gdb-multiarch");
  CHECK(attach_options.debugger_path == "gdb-multiarch");
  CHECK(attach_options.target == "1234");
}

TEST_CASE("g1dap translator builds breakpoint specs and bodies") {
  dap::source_breakpoint source;
  source.line = 12;
  source.condition = "i > 3";
  source.hit_condition = "2";
  auto specs = to_breakpoint_specs({source});
  REQUIRE(specs.size() == 1);
  CHECK(specs[0].line == 12);
  CHECK(specs[0].condition == "i > 3");
  CHECK(specs[0].hit_condition == "2");

  engine::breakpoint_info installed;
  installed.id = 3;
  installed.verified = true;
  installed.line = 12;
  installed.source_path = "/src/main.c";
  engine::breakpoint_info rejected;
  rejected.message = "No source file named nowhere.c.";

  auto body = breakpoints_body({installed, rejected});
  REQUIRE(body["breakpoints"].size() == 2);
  CHECK(body["breakpoints"][0]["id"] == 3);
  CHECK(body["breakpoints"][0]["verified"] == true);
  CHECK(body["breakpoints"][0]["source"]["path"] == "/src/main.c");
  CHECK(body["breakpoints"][1]["verified"] == false);
  CHECK(body["breakpoints"][1]["message"] == "No source file named nowhere.c.");
  CHECK_FALSE(body["breakpoints"][1].contains("id"));
}

TEST_CASE("g1dap translator scope and variable bodies") {
  auto scopes = scopes_body()["scopes"];
  REQUIRE(scopes.size() == 1);
  CHECK(scopes[0]["name"] == "Local");
  CHECK(scopes[0]["variablesReference"] == k_local_scope_reference);
  CHECK(scopes[0]["expensive"] == false);

  auto variables = variables_body({{"x", "1", "int"}, {"y", "{...}", ""}})["variables"];
  REQUIRE(variables.size() == 2);
  CHECK(variables[0]["type"] == "int");
  CHECK_FALSE(variables[1].contains("type"));
  CHECK(variables[1]["variablesReference"] == 0);

  auto threads = threads_body({{1, "main"}, {2, "worker"}})["threads"];
  REQUIRE(threads.size() == 2);
  CHECK(threads[1]["id"] == 2);
  CHECK(threads[1]["name"] == "worker");

  auto evaluated = evaluate_body("42");
  CHECK(evaluated["result"] == "42");
  CHECK(evaluated["variablesReference"] == 0);
}
