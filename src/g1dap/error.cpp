#include "error.hpp"

namespace g1dap {

std::string error_code_to_string(error_code code) {
  switch (code) {
  case error_code::success:
    return "success";
  case error_code::spawn_failed:
    return "failed to start debugger";
  case error_code::engine_exited:
    return "debugger exited";
  case error_code::engine_error:
    return "debugger error";
  case error_code::invalid_state:
    return "invalid state";
  case error_code::not_supported:
    return "not supported";
  case error_code::invalid_argument:
    return "invalid argument";
  case error_code::protocol_error:
    return "protocol error";
  case error_code::io_error:
    return "i/o error";
  case error_code::unknown_error:
    return "unknown error";
  default:
    return "unrecognized error code";
  }
}

result make_error_result(error_code code, const std::string& context, int system_error) {
  result r;
  r.code = code;
  r.error_message = error_code_to_string(code);
  if (!context.empty()) {
    r.error_message += ": " + context;
  }
  if (system_error != 0) {
    r.system_error_code = system_error;
    r.error_message += " (system error: " + std::to_string(system_error) + ")";
  }
  return r;
}

result make_success_result() { return result{error_code::success, "", std::nullopt}; }

result make_engine_error(const std::string& message) {
  return result{error_code::engine_error, message, std::nullopt};
}

} // namespace g1dap
