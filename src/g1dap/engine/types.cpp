#include "types.hpp"

namespace g1dap::engine {

const char* event_kind_name(event_kind kind) {
  switch (kind) {
  case event_kind::fatal_error:
    return "fatal_error";
  case event_kind::output:
    return "output";
  case event_kind::running:
    return "running";
  case event_kind::breakpoint_hit:
    return "breakpoint_hit";
  case event_kind::end_stepping_range:
    return "end_stepping_range";
  case event_kind::function_finished:
    return "function_finished";
  case event_kind::exited_normally:
    return "exited_normally";
  case event_kind::signal_received:
    return "signal_received";
  case event_kind::paused:
    return "paused";
  case event_kind::error:
    return "error";
  default:
    return "unknown";
  }
}

} // namespace g1dap::engine
