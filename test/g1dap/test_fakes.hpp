#pragma once

#include <memory>
#include <string>
#include <vector>

#include "g1dap/engine/engine_executor.hpp"
#include "g1dap/session/client_sink.hpp"
#include "g1dap/session/session_controller.hpp"

namespace g1dap::test {

// shared, ordered record of engine calls and client traffic
using trace_log = std::vector<std::string>;

inline std::string frame_text(std::optional<int64_t> frame) { return frame ? std::to_string(*frame) : "-"; }

class fake_sink final : public session::client_sink {
public:
  explicit fake_sink(trace_log& log) : log_(log) {}

  void send_response(const dap::response& response) override {
    responses.push_back(response);
    log_.push_back("response " + response.command + (response.success ? "" : " failed"));
  }

  void send_event(const dap::event& event) override {
    events.push_back(event);
    std::string entry = "event " + event.name;
    if (event.name == "stopped") {
      entry += " " + event.body.value("reason", std::string());
    }
    log_.push_back(entry);
  }

  void show_error(const std::string& message) override {
    errors.push_back(message);
    log_.push_back("error " + message);
  }

  size_t count_events(const std::string& name) const {
    size_t count = 0;
    for (const auto& event : events) {
      if (event.name == name) {
        ++count;
      }
    }
    return count;
  }

  const dap::response& last_response() const { return responses.back(); }

  std::vector<dap::response> responses;
  std::vector<dap::event> events;
  std::vector<std::string> errors;

private:
  trace_log& log_;
};

// scripted engine; resuming commands emit running, pause emits paused
class fake_engine final : public engine::engine_executor {
public:
  fake_engine(event_callback on_event, trace_log& log) : on_event_(std::move(on_event)), log_(log) {}

  result spawn(const engine::spawn_options& options) override {
    spawned_with = options;
    log_.push_back("spawn " + options.debugger_path + " " + options.target);
    if (!spawn_error.empty()) {
      return make_error_result(error_code::spawn_failed, spawn_error);
    }
    return make_success_result();
  }

  result start_inferior() override {
    log_.push_back("start");
    return make_success_result();
  }

  result attach_inferior() override {
    log_.push_back("attach " + spawned_with.target);
    return make_success_result();
  }

  result clear_breakpoints() override {
    log_.push_back("clear");
    installed.clear();
    return make_success_result();
  }

  result set_breakpoints(
      const std::string& source_path, const std::vector<engine::breakpoint_spec>& specs,
      std::vector<engine::breakpoint_info>& out
  ) override {
    log_.push_back("set " + source_path + " " + std::to_string(specs.size()));
    out.clear();
    for (const auto& spec : specs) {
      engine::breakpoint_info info;
      info.id = next_breakpoint_++;
      info.verified = true;
      info.source_path = source_path;
      info.line = spec.line;
      installed.push_back(info);
      out.push_back(info);
    }
    return make_success_result();
  }

  result get_threads(std::vector<engine::thread_info>& out) override {
    log_.push_back("threads");
    out = threads;
    return make_success_result();
  }

  result get_stack(uint64_t thread_id, std::vector<engine::frame_info>& out) override {
    log_.push_back("stack " + std::to_string(thread_id));
    out = frames;
    return make_success_result();
  }

  result get_vars(int64_t variables_reference, std::vector<engine::variable_info>& out) override {
    log_.push_back("vars " + std::to_string(variables_reference));
    out = variables;
    return make_success_result();
  }

  result next(std::optional<uint64_t> thread_id) override { return resume("next", thread_id); }
  result step_in(std::optional<uint64_t> thread_id) override { return resume("step-in", thread_id); }
  result step_out(std::optional<uint64_t> thread_id) override { return resume("step-out", thread_id); }
  result continue_execution(std::optional<uint64_t> thread_id) override { return resume("continue", thread_id); }

  result pause() override {
    log_.push_back("pause");
    if (running) {
      running = false;
      emit(engine::event_kind::paused, 1);
    }
    return make_success_result();
  }

  bool is_stopped() const override { return !running; }

  result exec_user_cmd(const std::string& command, std::optional<int64_t> frame, mi::record& out) override {
    log_.push_back("user " + command + " " + frame_text(frame));
    if (!user_cmd_error.empty()) {
      out.kind = mi::record_kind::result;
      out.class_name = "error";
      return make_engine_error(user_cmd_error);
    }
    out.kind = mi::record_kind::result;
    out.class_name = "done";
    return make_success_result();
  }

  result evaluate_expr(const std::string& expression, std::optional<int64_t> frame, std::string& out) override {
    log_.push_back("eval " + expression + " " + frame_text(frame));
    if (!evaluate_error.empty()) {
      return make_engine_error(evaluate_error);
    }
    out = evaluate_value;
    return make_success_result();
  }

  void shutdown() override {
    log_.push_back("shutdown");
    shut_down = true;
  }

  void emit(engine::event_kind kind, uint64_t thread_id, std::string text = "", bool all_threads = false) {
    engine::engine_event event;
    event.kind = kind;
    event.thread_id = thread_id;
    event.all_threads = all_threads;
    event.text = std::move(text);
    on_event_(std::move(event));
  }

  engine::spawn_options spawned_with;
  std::string spawn_error;
  std::string evaluate_error;
  std::string user_cmd_error;
  std::string evaluate_value = "42";
  bool running = false;
  bool shut_down = false;
  std::vector<engine::breakpoint_info> installed;
  std::vector<engine::thread_info> threads{{1, "main"}};
  std::vector<engine::frame_info> frames;
  std::vector<engine::variable_info> variables;

private:
  result resume(const char* name, std::optional<uint64_t> thread_id) {
    log_.push_back(std::string(name) + (thread_id ? " " + std::to_string(*thread_id) : ""));
    running = true;
    emit(engine::event_kind::running, thread_id.value_or(1), "", true);
    return make_success_result();
  }

  event_callback on_event_;
  trace_log& log_;
  int64_t next_breakpoint_ = 1;
};

// controller wired to a fake engine and sink; messages are dispatched synchronously by drain()
struct session_harness {
  session_harness() : controller(make_config(), sink) {}

  session::session_controller::config make_config() {
    session::session_controller::config config;
    config.default_debugger = "gdb";
    config.make_engine = [this](engine::engine_executor::event_callback on_event) -> std::unique_ptr<engine::engine_executor> {
      auto created = std::make_unique<fake_engine>(std::move(on_event), log);
      if (!spawn_error.empty()) {
        created->spawn_error = spawn_error;
      }
      engine = created.get();
      return created;
    };
    return config;
  }

  void request(const std::string& command, dap::json arguments = dap::json::object()) {
    dap::request req;
    req.seq = next_seq++;
    req.command = command;
    req.arguments = std::move(arguments);
    controller.post_request(std::move(req));
    drain();
  }

  void drain() {
    while (controller.dispatch_next()) {
    }
  }

  void start(const std::string& program = "/bin/app") {
    request("initialize");
    request("launch", {{"program", program}});
  }

  size_t index_of(const std::string& entry, size_t from = 0) const {
    for (size_t i = from; i < log.size(); ++i) {
      if (log[i] == entry) {
        return i;
      }
    }
    return log.size();
  }

  bool logged(const std::string& entry) const { return index_of(entry) != log.size(); }

  size_t count(const std::string& entry, size_t from = 0) const {
    size_t found = 0;
    for (size_t i = from; i < log.size(); ++i) {
      if (log[i] == entry) {
        ++found;
      }
    }
    return found;
  }

  trace_log log;
  fake_sink sink{log};
  fake_engine* engine = nullptr;
  std::string spawn_error;
  int64_t next_seq = 1;
  session::session_controller controller;
};

} // namespace g1dap::test
