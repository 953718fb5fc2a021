#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace g1dap::engine {

struct spawn_options {
  std::string debugger_path;
  // program path for launch, process id for attach
  std::string target;
  std::vector<std::string> args;
  std::string cwd;
};

struct breakpoint_spec {
  int line = 0;
  std::optional<int> column;
  std::string condition;
  std::string hit_condition;
};

struct breakpoint_info {
  std::optional<int64_t> id;
  bool verified = false;
  std::string source_path;
  std::optional<int> line;
  std::string message;
};

struct thread_info {
  uint64_t id = 0;
  std::string name;
};

struct frame_info {
  int64_t id = 0;
  std::string name;
  std::string source_name;
  std::string source_path;
  int line = 0;
  int column = 0;
  std::string address;
};

struct variable_info {
  std::string name;
  std::string value;
  std::string type;
};

enum class event_kind {
  fatal_error,
  output,
  running,
  breakpoint_hit,
  end_stepping_range,
  function_finished,
  exited_normally,
  signal_received,
  paused,
  error,
};

struct engine_event {
  event_kind kind = event_kind::output;
  uint64_t thread_id = 0;
  bool all_threads = false;
  // raw record text for output, message for errors, signal name for signals
  std::string text;
};

const char* event_kind_name(event_kind kind);

} // namespace g1dap::engine
