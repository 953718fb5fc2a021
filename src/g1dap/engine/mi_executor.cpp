#include "mi_executor.hpp"

#include <utility>

#include "g1dap/mi/parser.hpp"
#include "g1dap/util/string_utils.hpp"

namespace g1dap::engine {

namespace {

std::string thread_option(std::optional<uint64_t> thread_id) {
  if (!thread_id || *thread_id == 0) {
    return "";
  }
  return " --thread " + std::to_string(*thread_id);
}

std::optional<int> parse_int(std::string_view text) { return util::parse_decimal<int>(text); }

event_kind stop_kind_for(const std::string& reason) {
  if (reason == "breakpoint-hit" || reason == "watchpoint-trigger" || reason == "read-watchpoint-trigger" ||
      reason == "access-watchpoint-trigger") {
    return event_kind::breakpoint_hit;
  }
  if (reason == "end-stepping-range" || reason == "location-reached") {
    return event_kind::end_stepping_range;
  }
  if (reason == "function-finished") {
    return event_kind::function_finished;
  }
  if (reason == "exited-normally" || reason == "exited" || reason == "exited-signalled") {
    return event_kind::exited_normally;
  }
  if (reason == "signal-received") {
    return event_kind::signal_received;
  }
  // attach completion and other unexplained stops
  return event_kind::paused;
}

} // namespace

mi_executor::mi_executor(event_callback on_event)
    : on_event_(std::move(on_event)), log_(redlog::get_logger("g1dap.engine")) {}

mi_executor::~mi_executor() { shutdown(); }

result mi_executor::spawn(const spawn_options& options) {
  if (options.debugger_path.empty()) {
    return make_error_result(error_code::invalid_argument, "debugger path required");
  }
  if (process_.started()) {
    return make_error_result(error_code::invalid_state, "debugger already running");
  }

  options_ = options;
  log_.info(
      "spawning debugger", redlog::field("debugger", options_.debugger_path), redlog::field("target", options_.target)
  );

  auto started = process_.start({options_.debugger_path, "--interpreter=mi2", "--quiet"});
  if (!started) {
    return started;
  }
  reader_ = std::thread(&mi_executor::reader_loop, this);

  mi::record record;
  auto async = execute("-gdb-set mi-async on", record);
  if (!async) {
    // older debuggers only know the previous spelling
    log_.warn("mi-async not accepted, falling back", redlog::field("error", async.error_message));
    auto fallback = execute("-gdb-set target-async on");
    if (!fallback) {
      return make_error_result(error_code::spawn_failed, fallback.error_message);
    }
  }

  if (!options_.cwd.empty()) {
    auto cd = execute("-environment-cd " + mi::quote(options_.cwd));
    if (!cd) {
      return make_error_result(error_code::spawn_failed, cd.error_message);
    }
  }

  log_.dbg("debugger ready", redlog::field("pid", process_.pid()));
  return make_success_result();
}

result mi_executor::start_inferior() {
  if (options_.target.empty()) {
    return make_error_result(error_code::invalid_argument, "no program specified");
  }

  auto load = execute("-file-exec-and-symbols " + mi::quote(options_.target));
  if (!load) {
    return load;
  }

  if (!options_.args.empty()) {
    std::string command = "-exec-arguments";
    for (const auto& arg : options_.args) {
      command += " " + mi::quote(arg);
    }
    auto args = execute(command);
    if (!args) {
      return args;
    }
  }

  return execute("-exec-run");
}

result mi_executor::attach_inferior() {
  if (!util::is_decimal(options_.target)) {
    return make_error_result(error_code::invalid_argument, "attach requires a process id, got '" + options_.target + "'");
  }
  return execute("-target-attach " + options_.target);
}

result mi_executor::clear_breakpoints() {
  // no ids deletes every breakpoint, including ones set from the console
  return execute("-break-delete");
}

result mi_executor::set_breakpoints(
    const std::string& source_path, const std::vector<breakpoint_spec>& specs, std::vector<breakpoint_info>& out
) {
  out.clear();
  for (const auto& spec : specs) {
    std::string command = "-break-insert -f";
    if (!spec.condition.empty()) {
      command += " -c " + mi::quote(spec.condition);
    }
    std::string hit_condition = util::trim_copy(spec.hit_condition);
    if (util::is_decimal(hit_condition)) {
      auto hits = parse_int(hit_condition);
      if (!hits) {
        return make_error_result(error_code::invalid_argument, "hit count out of range: " + hit_condition);
      }
      if (*hits > 1) {
        command += " -i " + std::to_string(*hits - 1);
      }
    }
    command += " " + mi::quote(source_path + ":" + std::to_string(spec.line));

    breakpoint_info info;
    info.source_path = source_path;
    info.line = spec.line;

    mi::record record;
    auto sent = send_command(command, record);
    if (!sent) {
      return sent;
    }
    if (record.is_error()) {
      info.message = record.error_message();
      log_.verbose(
          "breakpoint rejected", redlog::field("location", source_path + ":" + std::to_string(spec.line)),
          redlog::field("error", info.message)
      );
      out.push_back(std::move(info));
      continue;
    }

    const mi::value* bkpt = record.results.find("bkpt");
    if (bkpt) {
      if (auto number = parse_int(bkpt->string_of("number"))) {
        info.id = *number;
      }
      if (auto line = parse_int(bkpt->string_of("line"))) {
        info.line = *line;
      }
      std::string fullname = bkpt->string_of("fullname");
      if (!fullname.empty()) {
        info.source_path = fullname;
      }
      info.verified = bkpt->find("pending") == nullptr && bkpt->string_of("addr") != "<PENDING>";
      if (!info.verified) {
        info.message = "breakpoint pending until the code is loaded";
      }
    }
    out.push_back(std::move(info));
  }
  return make_success_result();
}

result mi_executor::get_threads(std::vector<thread_info>& out) {
  out.clear();
  mi::record record;
  auto listed = execute("-thread-info", record);
  if (!listed) {
    return listed;
  }

  const mi::value* threads = record.results.find("threads");
  if (!threads) {
    return make_success_result();
  }
  for (const auto& entry : threads->children) {
    auto id = entry.number_of("id");
    if (!id) {
      continue;
    }
    thread_info info;
    info.id = *id;
    info.name = entry.string_of("name");
    if (info.name.empty()) {
      info.name = entry.string_of("target-id", "thread " + std::to_string(*id));
    }
    out.push_back(std::move(info));
  }
  return make_success_result();
}

result mi_executor::get_stack(uint64_t thread_id, std::vector<frame_info>& out) {
  out.clear();
  mi::record record;
  auto listed = execute("-stack-list-frames" + thread_option(thread_id), record);
  if (!listed) {
    return listed;
  }

  const mi::value* stack = record.results.find("stack");
  if (!stack) {
    return make_success_result();
  }
  for (const auto& entry : stack->children) {
    frame_info frame;
    // id = level + 1; id 0 never names a frame
    frame.id = static_cast<int64_t>(entry.number_of("level").value_or(out.size())) + 1;
    frame.address = entry.string_of("addr");
    frame.name = entry.string_of("func", frame.address);
    frame.source_name = entry.string_of("file");
    frame.source_path = entry.string_of("fullname", frame.source_name);
    frame.line = parse_int(entry.string_of("line")).value_or(0);
    out.push_back(std::move(frame));
  }
  return make_success_result();
}

result mi_executor::get_vars(int64_t variables_reference, std::vector<variable_info>& out) {
  out.clear();
  log_.trc("listing variables", redlog::field("reference", variables_reference));

  mi::record record;
  auto listed = execute("-stack-list-variables --all-values", record);
  if (!listed) {
    return listed;
  }

  const mi::value* variables = record.results.find("variables");
  if (!variables) {
    return make_success_result();
  }
  for (const auto& entry : variables->children) {
    variable_info info;
    info.name = entry.string_of("name");
    info.value = entry.string_of("value");
    info.type = entry.string_of("type");
    out.push_back(std::move(info));
  }
  return make_success_result();
}

result mi_executor::resume(const char* command, std::optional<uint64_t> thread_id) {
  return execute(std::string(command) + thread_option(thread_id));
}

result mi_executor::next(std::optional<uint64_t> thread_id) { return resume("-exec-next", thread_id); }

result mi_executor::step_in(std::optional<uint64_t> thread_id) { return resume("-exec-step", thread_id); }

result mi_executor::step_out(std::optional<uint64_t> thread_id) { return resume("-exec-finish", thread_id); }

result mi_executor::continue_execution(std::optional<uint64_t> thread_id) {
  return resume("-exec-continue", thread_id);
}

result mi_executor::pause() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return make_success_result();
    }
    interrupt_pending_ = true;
  }

  auto interrupted = execute("-exec-interrupt");
  std::unique_lock<std::mutex> lock(mutex_);
  if (!interrupted) {
    interrupt_pending_ = false;
    return interrupted;
  }

  // the acknowledgement is the stop itself, not the ^done
  cv_.wait(lock, [this] { return stopped_ || exited_; });
  if (!stopped_) {
    return make_error_result(error_code::engine_exited, "debugger exited while pausing");
  }
  return make_success_result();
}

bool mi_executor::is_stopped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopped_;
}

result mi_executor::exec_user_cmd(const std::string& command, std::optional<int64_t> frame, mi::record& out) {
  auto sent = send_command("-interpreter-exec" + frame_options(frame) + " console " + mi::quote(command), out);
  if (!sent) {
    return sent;
  }
  if (out.is_error()) {
    engine_event event;
    event.kind = event_kind::error;
    event.text = out.error_message();
    emit(std::move(event));
  }
  return make_success_result();
}

result mi_executor::evaluate_expr(const std::string& expression, std::optional<int64_t> frame, std::string& out) {
  mi::record record;
  auto evaluated = execute("-data-evaluate-expression" + frame_options(frame) + " " + mi::quote(expression), record);
  if (!evaluated) {
    return evaluated;
  }
  out = record.results.string_of("value");
  return make_success_result();
}

void mi_executor::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }

  if (process_.started()) {
    log_.info("stopping debugger", redlog::field("pid", process_.pid()));
    process_.terminate();
  }
  if (reader_.joinable()) {
    reader_.join();
  }
  process_.close();
}

result mi_executor::send_command(const std::string& command, mi::record& out) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (exited_ || !process_.started()) {
    return make_error_result(error_code::engine_exited, "debugger is not running");
  }
  uint64_t token = next_token_++;
  pending_.emplace(token, pending_command{});
  lock.unlock();

  log_.dbg("send", redlog::field("token", token), redlog::field("command", command));
  auto written = process_.write_line(std::to_string(token) + command);

  lock.lock();
  if (!written) {
    pending_.erase(token);
    return written;
  }

  cv_.wait(lock, [&] {
    auto it = pending_.find(token);
    return exited_ || (it != pending_.end() && it->second.done);
  });

  auto it = pending_.find(token);
  if (it == pending_.end() || !it->second.done) {
    pending_.erase(token);
    return make_error_result(error_code::engine_exited, "debugger exited before answering '" + command + "'");
  }
  out = std::move(it->second.result);
  pending_.erase(it);
  return make_success_result();
}

result mi_executor::execute(const std::string& command, mi::record& out) {
  auto sent = send_command(command, out);
  if (!sent) {
    return sent;
  }
  if (out.is_error()) {
    log_.dbg("command failed", redlog::field("command", command), redlog::field("error", out.error_message()));
    return make_engine_error(out.error_message());
  }
  return make_success_result();
}

result mi_executor::execute(const std::string& command) {
  mi::record ignored;
  return execute(command, ignored);
}

std::string mi_executor::frame_options(std::optional<int64_t> frame) const {
  if (!frame) {
    return "";
  }
  uint64_t thread = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    thread = current_thread_ != 0 ? current_thread_ : 1;
  }
  return " --thread " + std::to_string(thread) + " --frame " + std::to_string(*frame);
}

void mi_executor::reader_loop() {
  std::string line;
  while (process_.read_line(line)) {
    log_.ped("recv", redlog::field("line", line));
    handle_record(mi::parse_line(line));
  }

  bool expected = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    exited_ = true;
    expected = stopping_;
  }
  cv_.notify_all();

  if (!expected) {
    log_.error("debugger output closed unexpectedly");
    engine_event event;
    event.kind = event_kind::fatal_error;
    event.text = "debugger exited unexpectedly";
    emit(std::move(event));
  }
}

void mi_executor::handle_record(mi::record record) {
  switch (record.kind) {
  case mi::record_kind::result:
    handle_result(std::move(record));
    break;
  case mi::record_kind::exec_async:
    handle_exec_async(record);
    break;
  case mi::record_kind::console_stream:
  case mi::record_kind::target_stream:
  case mi::record_kind::log_stream:
  case mi::record_kind::unknown: {
    if (record.raw.empty()) {
      break;
    }
    engine_event event;
    event.kind = event_kind::output;
    event.text = record.raw;
    emit(std::move(event));
    break;
  }
  case mi::record_kind::status_async:
  case mi::record_kind::notify_async:
    log_.trc("notification", redlog::field("class", record.class_name));
    break;
  case mi::record_kind::prompt:
  default:
    break;
  }
}

void mi_executor::handle_result(mi::record record) {
  bool matched = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (record.class_name == "running") {
      stopped_ = false;
    }
    if (record.token) {
      auto it = pending_.find(*record.token);
      if (it != pending_.end()) {
        it->second.done = true;
        it->second.result = record;
        matched = true;
      }
    }
  }

  if (matched) {
    cv_.notify_all();
    return;
  }

  log_.warn("unsolicited result record", redlog::field("line", record.raw));
  if (record.is_error()) {
    engine_event event;
    event.kind = event_kind::error;
    event.text = record.error_message();
    emit(std::move(event));
  }
}

void mi_executor::handle_exec_async(const mi::record& record) {
  engine_event event;

  if (record.class_name == "running") {
    std::string thread = record.results.string_of("thread-id", "all");
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = false;
      event.all_threads = thread == "all";
      event.thread_id = event.all_threads ? (current_thread_ != 0 ? current_thread_ : 1)
                                          : record.results.number_of("thread-id").value_or(1);
    }
    event.kind = event_kind::running;
    emit(std::move(event));
    return;
  }

  if (record.class_name != "stopped") {
    log_.trc("exec notification", redlog::field("class", record.class_name));
    return;
  }

  std::string reason = record.results.string_of("reason");
  event.kind = stop_kind_for(reason);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
    if (auto thread = record.results.number_of("thread-id")) {
      current_thread_ = *thread;
    }
    event.thread_id = current_thread_ != 0 ? current_thread_ : 1;

    if (event.kind == event_kind::signal_received || event.kind == event_kind::paused) {
      std::string signal = record.results.string_of("signal-name");
      if (interrupt_pending_ && (signal.empty() || signal == "SIGINT" || signal == "0")) {
        event.kind = event_kind::paused;
      }
      event.text = signal;
    }
    interrupt_pending_ = false;
  }
  cv_.notify_all();

  log_.dbg(
      "target stopped", redlog::field("reason", reason), redlog::field("thread", event.thread_id),
      redlog::field("event", event_kind_name(event.kind))
  );
  emit(std::move(event));
}

void mi_executor::emit(engine_event event) {
  if (on_event_) {
    on_event_(std::move(event));
  }
}

} // namespace g1dap::engine
