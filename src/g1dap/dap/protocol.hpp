#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "g1dap/error.hpp"

namespace g1dap::dap {

using json = nlohmann::json;

struct request {
  int64_t seq = 0;
  std::string command;
  json arguments = json::object();
};

struct response {
  int64_t request_seq = 0;
  std::string command;
  bool success = true;
  std::string message;
  json body = json::object();
};

struct event {
  std::string name;
  json body = json::object();
};

// wire conversion; seq is assigned by the sender
result parse_request(const json& message, request& out);
json to_json(const response& value, int64_t seq);
json to_json(const event& value, int64_t seq);

response make_response(const request& req, json body = json::object());
response make_error_response(const request& req, const std::string& message);

event make_initialized_event();
event make_stopped_event(const std::string& reason, uint64_t thread_id);
event make_continued_event(uint64_t thread_id, bool all_threads);
event make_output_event(const std::string& text, const std::string& category);
event make_terminated_event();

// request arguments

struct launch_arguments {
  std::string program;
  std::string cwd;
  std::string debugger;
  std::vector<std::string> args;
  bool trace = false;
  bool stop_on_entry = false;
};

struct attach_arguments {
  // process id, given as a number or a string
  std::string program;
  std::string debugger;
  bool trace = false;
};

struct source_breakpoint {
  int line = 0;
  std::optional<int> column;
  std::string condition;
  std::string hit_condition;
};

struct set_breakpoints_arguments {
  std::string source_path;
  std::vector<source_breakpoint> breakpoints;
};

struct thread_arguments {
  std::optional<uint64_t> thread_id;
};

struct variables_arguments {
  int64_t variables_reference = 0;
};

struct evaluate_arguments {
  std::string expression;
  std::optional<int64_t> frame_id;
  std::string context;
};

struct set_variable_arguments {
  int64_t variables_reference = 0;
  std::string name;
  std::string value;
};

result parse_arguments(const json& arguments, launch_arguments& out);
result parse_arguments(const json& arguments, attach_arguments& out);
result parse_arguments(const json& arguments, set_breakpoints_arguments& out);
result parse_arguments(const json& arguments, thread_arguments& out);
result parse_arguments(const json& arguments, variables_arguments& out);
result parse_arguments(const json& arguments, evaluate_arguments& out);
result parse_arguments(const json& arguments, set_variable_arguments& out);

} // namespace g1dap::dap
