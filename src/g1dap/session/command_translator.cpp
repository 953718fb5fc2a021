#include "command_translator.hpp"

namespace g1dap::session {

std::optional<int64_t> to_engine_frame(std::optional<int64_t> client_frame) {
  if (!client_frame || *client_frame == 0) {
    return std::nullopt;
  }
  return *client_frame - 1;
}

evaluate_mode evaluate_mode_for(const std::string& context) {
  if (context == "hover" || context == "watch") {
    return evaluate_mode::expression;
  }
  return evaluate_mode::console;
}

std::vector<engine::breakpoint_spec> to_breakpoint_specs(const std::vector<dap::source_breakpoint>& breakpoints) {
  std::vector<engine::breakpoint_spec> specs;
  specs.reserve(breakpoints.size());
  for (const auto& bp : breakpoints) {
    engine::breakpoint_spec spec;
    spec.line = bp.line;
    spec.column = bp.column;
    spec.condition = bp.condition;
    spec.hit_condition = bp.hit_condition;
    specs.push_back(std::move(spec));
  }
  return specs;
}

namespace {

std::string pick_debugger(const std::string& requested, const std::string& fallback) {
  return requested.empty() ? fallback : requested;
}

} // namespace

engine::spawn_options to_spawn_options(const dap::launch_arguments& args, const std::string& default_debugger) {
  engine::spawn_options options;
  options.debugger_path = pick_debugger(args.debugger, default_debugger);
  options.target = args.program;
  options.args = args.args;
  options.cwd = args.cwd;
  return options;
}

engine::spawn_options to_spawn_options(const dap::attach_arguments& args, const std::string& default_debugger) {
  engine::spawn_options options;
  options.debugger_path = pick_debugger(args.debugger, default_debugger);
  options.target = args.program;
  return options;
}

int64_t total_frames(size_t frame_count) {
  // one less than the frames returned
  return frame_count == 0 ? 0 : static_cast<int64_t>(frame_count) - 1;
}

dap::json breakpoints_body(const std::vector<engine::breakpoint_info>& breakpoints) {
  dap::json list = dap::json::array();
  for (const auto& bp : breakpoints) {
    dap::json item = {{"verified", bp.verified}};
    if (bp.id) {
      item["id"] = *bp.id;
    }
    if (bp.line) {
      item["line"] = *bp.line;
    }
    if (!bp.source_path.empty()) {
      item["source"] = {{"path", bp.source_path}};
    }
    if (!bp.message.empty()) {
      item["message"] = bp.message;
    }
    list.push_back(std::move(item));
  }
  return {{"breakpoints", std::move(list)}};
}

dap::json threads_body(const std::vector<engine::thread_info>& threads) {
  dap::json list = dap::json::array();
  for (const auto& thread : threads) {
    list.push_back({{"id", thread.id}, {"name", thread.name}});
  }
  return {{"threads", std::move(list)}};
}

dap::json stack_trace_body(const std::vector<engine::frame_info>& frames) {
  dap::json list = dap::json::array();
  for (const auto& frame : frames) {
    dap::json item = {
        {"id", frame.id},
        {"name", frame.name},
        {"line", frame.line},
        {"column", frame.column},
    };
    if (!frame.source_path.empty() || !frame.source_name.empty()) {
      item["source"] = {{"name", frame.source_name}, {"path", frame.source_path}};
    }
    if (!frame.address.empty()) {
      item["instructionPointerReference"] = frame.address;
    }
    list.push_back(std::move(item));
  }
  return {{"stackFrames", std::move(list)}, {"totalFrames", total_frames(frames.size())}};
}

dap::json scopes_body() {
  dap::json local = {
      {"name", "Local"},
      {"variablesReference", k_local_scope_reference},
      {"expensive", false},
  };
  return {{"scopes", dap::json::array({local})}};
}

dap::json variables_body(const std::vector<engine::variable_info>& variables) {
  dap::json list = dap::json::array();
  for (const auto& variable : variables) {
    dap::json item = {{"name", variable.name}, {"value", variable.value}, {"variablesReference", 0}};
    if (!variable.type.empty()) {
      item["type"] = variable.type;
    }
    list.push_back(std::move(item));
  }
  return {{"variables", std::move(list)}};
}

dap::json evaluate_body(const std::string& result) { return {{"result", result}, {"variablesReference", 0}}; }

} // namespace g1dap::session
