#include "protocol.hpp"

#include <exception>
#include <utility>

namespace g1dap::dap {

namespace {

const json& object_or_empty(const json& value) {
  static const json empty = json::object();
  return value.is_object() ? value : empty;
}

std::string string_field(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return "";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  // numbers and booleans arrive where strings are expected, e.g. a pid
  return it->dump();
}

std::optional<int64_t> int_field(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  return it->get<int64_t>();
}

result missing(const char* key) {
  return make_error_result(error_code::invalid_argument, std::string("missing '") + key + "'");
}

} // namespace

result parse_request(const json& message, request& out) {
  if (!message.is_object()) {
    return make_error_result(error_code::protocol_error, "message is not an object");
  }
  try {
    if (message.value("type", "") != "request") {
      return make_error_result(error_code::protocol_error, "message is not a request");
    }
    out.seq = message.value("seq", int64_t{0});
    out.command = message.value("command", "");
    auto args = message.find("arguments");
    out.arguments = (args != message.end() && args->is_object()) ? *args : json::object();
  } catch (const json::exception& e) {
    return make_error_result(error_code::protocol_error, e.what());
  }

  if (out.command.empty()) {
    return make_error_result(error_code::protocol_error, "request has no command");
  }
  return make_success_result();
}

json to_json(const response& value, int64_t seq) {
  json message = {
      {"seq", seq},
      {"type", "response"},
      {"request_seq", value.request_seq},
      {"command", value.command},
      {"success", value.success},
  };
  if (!value.message.empty()) {
    message["message"] = value.message;
  }
  if (!value.success && !value.message.empty()) {
    message["body"] = {{"error", {{"id", 1}, {"format", value.message}, {"showUser", true}}}};
  } else if (!value.body.empty()) {
    message["body"] = value.body;
  }
  return message;
}

json to_json(const event& value, int64_t seq) {
  json message = {
      {"seq", seq},
      {"type", "event"},
      {"event", value.name},
  };
  if (!value.body.empty()) {
    message["body"] = value.body;
  }
  return message;
}

response make_response(const request& req, json body) {
  response out;
  out.request_seq = req.seq;
  out.command = req.command;
  out.success = true;
  out.body = std::move(body);
  return out;
}

response make_error_response(const request& req, const std::string& message) {
  response out;
  out.request_seq = req.seq;
  out.command = req.command;
  out.success = false;
  out.message = message;
  return out;
}

event make_initialized_event() { return event{"initialized", json::object()}; }

event make_stopped_event(const std::string& reason, uint64_t thread_id) {
  return event{"stopped", {{"reason", reason}, {"threadId", thread_id}}};
}

event make_continued_event(uint64_t thread_id, bool all_threads) {
  return event{"continued", {{"threadId", thread_id}, {"allThreadsContinued", all_threads}}};
}

event make_output_event(const std::string& text, const std::string& category) {
  return event{"output", {{"category", category}, {"output", text}}};
}

event make_terminated_event() { return event{"terminated", json::object()}; }

result parse_arguments(const json& arguments, launch_arguments& out) {
  const json& args = object_or_empty(arguments);
  try {
    out.program = string_field(args, "program");
    out.cwd = string_field(args, "cwd");
    out.debugger = string_field(args, "debugger");
    out.trace = args.value("trace", false);
    out.stop_on_entry = args.value("stopOnEntry", false);
    out.args.clear();
    if (auto it = args.find("args"); it != args.end() && it->is_array()) {
      for (const auto& arg : *it) {
        out.args.push_back(arg.is_string() ? arg.get<std::string>() : arg.dump());
      }
    }
  } catch (const json::exception& e) {
    return make_error_result(error_code::invalid_argument, e.what());
  }

  if (out.program.empty()) {
    return missing("program");
  }
  return make_success_result();
}

result parse_arguments(const json& arguments, attach_arguments& out) {
  const json& args = object_or_empty(arguments);
  try {
    out.program = string_field(args, "program");
    out.debugger = string_field(args, "debugger");
    out.trace = args.value("trace", false);
  } catch (const json::exception& e) {
    return make_error_result(error_code::invalid_argument, e.what());
  }

  if (out.program.empty()) {
    return missing("program");
  }
  return make_success_result();
}

result parse_arguments(const json& arguments, set_breakpoints_arguments& out) {
  const json& args = object_or_empty(arguments);
  try {
    out.source_path.clear();
    out.breakpoints.clear();
    if (auto source = args.find("source"); source != args.end() && source->is_object()) {
      out.source_path = string_field(*source, "path");
    }
    if (auto list = args.find("breakpoints"); list != args.end() && list->is_array()) {
      for (const auto& entry : *list) {
        source_breakpoint bp;
        bp.line = static_cast<int>(int_field(entry, "line").value_or(0));
        if (auto column = int_field(entry, "column")) {
          bp.column = static_cast<int>(*column);
        }
        bp.condition = string_field(entry, "condition");
        bp.hit_condition = string_field(entry, "hitCondition");
        out.breakpoints.push_back(std::move(bp));
      }
    } else if (auto lines = args.find("lines"); lines != args.end() && lines->is_array()) {
      // legacy form
      for (const auto& line : *lines) {
        source_breakpoint bp;
        bp.line = line.get<int>();
        out.breakpoints.push_back(std::move(bp));
      }
    }
  } catch (const json::exception& e) {
    return make_error_result(error_code::invalid_argument, e.what());
  }
  return make_success_result();
}

result parse_arguments(const json& arguments, thread_arguments& out) {
  const json& args = object_or_empty(arguments);
  out.thread_id.reset();
  if (auto id = int_field(args, "threadId"); id && *id > 0) {
    out.thread_id = static_cast<uint64_t>(*id);
  }
  return make_success_result();
}

result parse_arguments(const json& arguments, variables_arguments& out) {
  const json& args = object_or_empty(arguments);
  auto reference = int_field(args, "variablesReference");
  if (!reference) {
    return missing("variablesReference");
  }
  out.variables_reference = *reference;
  return make_success_result();
}

result parse_arguments(const json& arguments, evaluate_arguments& out) {
  const json& args = object_or_empty(arguments);
  out.expression = string_field(args, "expression");
  out.context = string_field(args, "context");
  out.frame_id = int_field(args, "frameId");
  return make_success_result();
}

result parse_arguments(const json& arguments, set_variable_arguments& out) {
  const json& args = object_or_empty(arguments);
  auto reference = int_field(args, "variablesReference");
  if (!reference) {
    return missing("variablesReference");
  }
  out.variables_reference = *reference;
  out.name = string_field(args, "name");
  out.value = string_field(args, "value");
  if (out.name.empty()) {
    return missing("name");
  }
  return make_success_result();
}

} // namespace g1dap::dap
