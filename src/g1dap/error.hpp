#pragma once

#include <optional>
#include <string>

namespace g1dap {

enum class error_code {
  success,

  // engine lifecycle
  spawn_failed,
  engine_exited,

  // engine operations
  engine_error,
  invalid_state,
  not_supported,

  // client protocol
  invalid_argument,
  protocol_error,

  // system errors
  io_error,

  unknown_error
};

struct result {
  error_code code;
  std::string error_message;
  std::optional<int> system_error_code;

  bool success() const { return code == error_code::success; }
  operator bool() const { return success(); }
};

std::string error_code_to_string(error_code code);
result make_error_result(error_code code, const std::string& context = "", int system_error = 0);
result make_success_result();

// engine failures carry the engine's own text, which is what the client shows
result make_engine_error(const std::string& message);

} // namespace g1dap
