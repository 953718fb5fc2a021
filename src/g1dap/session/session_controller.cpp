#include "session_controller.hpp"

#include <type_traits>
#include <utility>

namespace g1dap::session {

const char* session_mode_name(session_mode mode) {
  switch (mode) {
  case session_mode::none:
    return "none";
  case session_mode::launch:
    return "launch";
  case session_mode::attach:
    return "attach";
  default:
    return "unknown";
  }
}

session_controller::session_controller(config config, client_sink& sink)
    : config_(std::move(config)), sink_(sink), log_(redlog::get_logger("g1dap.session")), router_(sink, tracker_) {
  router_.set_debug_logging(config_.debug_logging);
}

session_controller::~session_controller() {
  if (engine_) {
    engine_->shutdown();
  }
}

void session_controller::post_request(dap::request request) { inbox_.push(std::move(request)); }

void session_controller::post_event(engine::engine_event event) { inbox_.push(std::move(event)); }

void session_controller::post_close() { inbox_.close(); }

void session_controller::run() {
  log_.inf("session started", redlog::field("debugger", config_.default_debugger));

  session_message message;
  while (!finished_ && inbox_.wait(message)) {
    dispatch(message);
  }

  if (engine_) {
    engine_->shutdown();
  }
  log_.inf("session ended", redlog::field("mode", session_mode_name(mode_)));
}

bool session_controller::dispatch_next() {
  session_message message;
  if (!inbox_.poll(message)) {
    return false;
  }
  dispatch(message);
  return true;
}

void session_controller::dispatch(const session_message& message) {
  std::visit(
      [this](const auto& item) {
        using item_type = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<item_type, dap::request>) {
          handle_request(item);
        } else {
          handle_event(item);
        }
      },
      message
  );
}

void session_controller::handle_event(const engine::engine_event& event) { router_.route(event); }

session_controller::request_handler session_controller::find_handler(const std::string& command) {
  static const std::pair<const char*, request_handler> handlers[] = {
      {"initialize", &session_controller::handle_initialize},
      {"launch", &session_controller::handle_launch},
      {"attach", &session_controller::handle_attach},
      {"configurationDone", &session_controller::handle_configuration_done},
      {"setBreakpoints", &session_controller::handle_set_breakpoints},
      {"threads", &session_controller::handle_threads},
      {"stackTrace", &session_controller::handle_stack_trace},
      {"scopes", &session_controller::handle_scopes},
      {"variables", &session_controller::handle_variables},
      {"next", &session_controller::handle_next},
      {"stepIn", &session_controller::handle_step_in},
      {"stepOut", &session_controller::handle_step_out},
      {"continue", &session_controller::handle_continue},
      {"evaluate", &session_controller::handle_evaluate},
      {"setVariable", &session_controller::handle_set_variable},
      {"pause", &session_controller::handle_pause},
      {"terminate", &session_controller::handle_terminate},
      {"disconnect", &session_controller::handle_disconnect},
  };

  for (const auto& [name, handler] : handlers) {
    if (command == name) {
      return handler;
    }
  }
  return nullptr;
}

void session_controller::handle_request(const dap::request& request) {
  if (config_.debug_logging) {
    log_.inf(
        "request", redlog::field("seq", request.seq), redlog::field("command", request.command),
        redlog::field("arguments", request.arguments.dump())
    );
  } else {
    log_.dbg("request", redlog::field("seq", request.seq), redlog::field("command", request.command));
  }

  if (finished_) {
    reply_error(request, "debug session has ended");
    return;
  }

  request_handler handler = find_handler(request.command);
  if (!handler) {
    log_.wrn("unsupported request", redlog::field("command", request.command));
    reply_error(request, "unsupported request '" + request.command + "'");
    return;
  }

  if (!initialized_ && request.command != "initialize" && request.command != "disconnect") {
    reply_error(request, "session is not initialized");
    return;
  }

  bool always_allowed = request.command == "initialize" || request.command == "terminate" ||
                        request.command == "disconnect" || request.command == "configurationDone";
  if (tracker_.terminated() && !always_allowed) {
    reply_error(request, "debug session has terminated");
    return;
  }

  (this->*handler)(request);
}

void session_controller::handle_initialize(const dap::request& request) {
  if (!router_.subscribe()) {
    reply_error(request, "session is already initialized");
    return;
  }
  initialized_ = true;

  dap::json capabilities = {
      {"supportsConfigurationDoneRequest", true},
      {"supportsEvaluateForHovers", true},
      {"supportsSetVariable", true},
      {"supportsTerminateRequest", true},
  };
  reply(request, std::move(capabilities));
  sink_.send_event(dap::make_initialized_event());
}

result session_controller::start_engine(const engine::spawn_options& options) {
  if (engine_) {
    return make_error_result(error_code::invalid_state, "debugger already started");
  }
  if (!config_.make_engine) {
    return make_error_result(error_code::not_supported, "no debugger engine configured");
  }

  engine_ = config_.make_engine([this](engine::engine_event event) { post_event(std::move(event)); });
  if (!engine_) {
    return make_error_result(error_code::spawn_failed, options.debugger_path);
  }

  log_.inf(
      "starting debugger", redlog::field("debugger", options.debugger_path), redlog::field("target", options.target),
      redlog::field("mode", session_mode_name(mode_))
  );
  return engine_->spawn(options);
}

void session_controller::fail_start(const dap::request& request, const std::string& message) {
  log_.err("failed to start debug session", redlog::field("command", request.command), redlog::field("error", message));
  reply_error(request, message);
  if (engine_) {
    engine_->shutdown();
  }
  if (tracker_.terminate()) {
    sink_.send_event(dap::make_terminated_event());
  }
}

void session_controller::handle_launch(const dap::request& request) {
  dap::launch_arguments args;
  auto parsed = dap::parse_arguments(request.arguments, args);
  if (!parsed) {
    fail_start(request, parsed.error_message);
    return;
  }

  if (args.trace && !config_.debug_logging) {
    config_.debug_logging = true;
    router_.set_debug_logging(true);
  }

  mode_ = session_mode::launch;
  auto started = start_engine(to_spawn_options(args, config_.default_debugger));
  if (!started) {
    fail_start(request, started.error_message);
    return;
  }

  auto inferior = engine_->start_inferior();
  if (!inferior) {
    fail_start(request, inferior.error_message);
    return;
  }
  tracker_.on_resume_acknowledged();
  reply(request);
}

void session_controller::handle_attach(const dap::request& request) {
  dap::attach_arguments args;
  auto parsed = dap::parse_arguments(request.arguments, args);
  if (!parsed) {
    fail_start(request, parsed.error_message);
    return;
  }

  if (args.trace && !config_.debug_logging) {
    config_.debug_logging = true;
    router_.set_debug_logging(true);
  }

  mode_ = session_mode::attach;
  auto started = start_engine(to_spawn_options(args, config_.default_debugger));
  if (!started) {
    fail_start(request, started.error_message);
    return;
  }

  auto attached = engine_->attach_inferior();
  if (!attached) {
    fail_start(request, attached.error_message);
    return;
  }
  reply(request);
}

void session_controller::handle_configuration_done(const dap::request& request) { reply(request); }

void session_controller::handle_set_breakpoints(const dap::request& request) {
  if (!require_engine(request)) {
    return;
  }

  dap::set_breakpoints_arguments args;
  auto parsed = dap::parse_arguments(request.arguments, args);
  if (!parsed) {
    reply_result(request, parsed);
    return;
  }

  auto cleared = engine_->clear_breakpoints();
  if (!cleared) {
    reply_result(request, cleared);
    return;
  }

  std::vector<engine::breakpoint_info> installed;
  auto set = engine_->set_breakpoints(args.source_path, to_breakpoint_specs(args.breakpoints), installed);
  if (!set) {
    reply_result(request, set);
    return;
  }

  log_.dbg(
      "breakpoints replaced", redlog::field("source", args.source_path),
      redlog::field("requested", args.breakpoints.size()), redlog::field("installed", installed.size())
  );
  reply(request, breakpoints_body(installed));
}

void session_controller::handle_threads(const dap::request& request) {
  if (!require_engine(request)) {
    return;
  }

  std::vector<engine::thread_info> threads;
  auto listed = engine_->get_threads(threads);
  if (!listed) {
    reply_result(request, listed);
    return;
  }
  reply(request, threads_body(threads));
}

void session_controller::handle_stack_trace(const dap::request& request) {
  if (!require_engine(request)) {
    return;
  }

  dap::thread_arguments args;
  auto parsed = dap::parse_arguments(request.arguments, args);
  if (!parsed) {
    reply_result(request, parsed);
    return;
  }

  auto stopped = ensure_stopped();
  if (!stopped) {
    reply_result(request, stopped);
    return;
  }

  std::vector<engine::frame_info> frames;
  auto listed = engine_->get_stack(args.thread_id.value_or(0), frames);
  if (!listed) {
    reply_result(request, listed);
    return;
  }
  reply(request, stack_trace_body(frames));
}

void session_controller::handle_scopes(const dap::request& request) { reply(request, scopes_body()); }

void session_controller::handle_variables(const dap::request& request) {
  if (!require_engine(request)) {
    return;
  }

  dap::variables_arguments args;
  auto parsed = dap::parse_arguments(request.arguments, args);
  if (!parsed) {
    reply_result(request, parsed);
    return;
  }

  auto stopped = ensure_stopped();
  if (!stopped) {
    reply_result(request, stopped);
    return;
  }

  std::vector<engine::variable_info> variables;
  auto listed = engine_->get_vars(args.variables_reference, variables);
  if (!listed) {
    reply_result(request, listed);
    return;
  }
  reply(request, variables_body(variables));
}

void session_controller::handle_next(const dap::request& request) {
  if (!require_engine(request)) {
    return;
  }
  dap::thread_arguments args;
  auto status = dap::parse_arguments(request.arguments, args);
  if (status) {
    status = ensure_stopped();
  }
  if (status) {
    status = engine_->next(args.thread_id);
  }
  if (status) {
    tracker_.on_resume_acknowledged();
  }
  reply_result(request, status);
}

void session_controller::handle_step_in(const dap::request& request) {
  if (!require_engine(request)) {
    return;
  }
  dap::thread_arguments args;
  auto status = dap::parse_arguments(request.arguments, args);
  if (status) {
    status = ensure_stopped();
  }
  if (status) {
    status = engine_->step_in(args.thread_id);
  }
  if (status) {
    tracker_.on_resume_acknowledged();
  }
  reply_result(request, status);
}

void session_controller::handle_step_out(const dap::request& request) {
  if (!require_engine(request)) {
    return;
  }
  dap::thread_arguments args;
  auto status = dap::parse_arguments(request.arguments, args);
  if (status) {
    status = ensure_stopped();
  }
  if (status) {
    status = engine_->step_out(args.thread_id);
  }
  if (status) {
    tracker_.on_resume_acknowledged();
  }
  reply_result(request, status);
}

void session_controller::handle_continue(const dap::request& request) {
  if (!require_engine(request)) {
    return;
  }

  dap::thread_arguments args;
  auto parsed = dap::parse_arguments(request.arguments, args);
  if (!parsed) {
    reply_result(request, parsed);
    return;
  }

  if (target_running()) {
    log_.dbg("continue ignored, target already running");
    reply(request, {{"allThreadsContinued", true}});
    return;
  }

  auto resumed = engine_->continue_execution(args.thread_id);
  if (!resumed) {
    reply_result(request, resumed);
    return;
  }
  tracker_.on_resume_acknowledged();
  reply(request, {{"allThreadsContinued", true}});
}

void session_controller::handle_evaluate(const dap::request& request) {
  if (!require_engine(request)) {
    return;
  }

  dap::evaluate_arguments args;
  auto parsed = dap::parse_arguments(request.arguments, args);
  if (!parsed) {
    reply_result(request, parsed);
    return;
  }

  auto frame = to_engine_frame(args.frame_id);

  if (evaluate_mode_for(args.context) == evaluate_mode::expression) {
    // never interrupts; a running target answers with the engine's error
    std::string value;
    auto evaluated = engine_->evaluate_expr(args.expression, frame, value);
    if (!evaluated) {
      reply_result(request, evaluated);
      return;
    }
    reply(request, evaluate_body(value));
    return;
  }

  mi::record record;
  result executed = target_running() ? run_console_bracket(args.expression, frame, record)
                                     : engine_->exec_user_cmd(args.expression, frame, record);
  if (!executed) {
    reply_result(request, executed);
    return;
  }
  // console output reaches the client as output events
  reply(request, evaluate_body(""));
}

result session_controller::run_console_bracket(
    const std::string& command, std::optional<int64_t> frame, mi::record& out
) {
  log_.dbg("interrupting target for console command", redlog::field("command", command));

  tracker_.hide_next_pause();
  auto paused = engine_->pause();
  if (!paused) {
    tracker_.cancel_hidden_pause();
    return paused;
  }
  tracker_.on_pause_acknowledged();

  auto executed = engine_->exec_user_cmd(command, frame, out);
  if (!executed) {
    log_.wrn("console command failed", redlog::field("error", executed.error_message));
  }

  tracker_.hide_next_resume();
  auto resumed = engine_->continue_execution(std::nullopt);
  if (!resumed) {
    tracker_.cancel_hidden_resume();
    return resumed;
  }
  tracker_.on_resume_acknowledged();
  return executed;
}

void session_controller::handle_set_variable(const dap::request& request) {
  if (!require_engine(request)) {
    return;
  }

  dap::set_variable_arguments args;
  auto parsed = dap::parse_arguments(request.arguments, args);
  if (!parsed) {
    reply_result(request, parsed);
    return;
  }

  auto stopped = ensure_stopped();
  if (!stopped) {
    reply_result(request, stopped);
    return;
  }

  std::string value;
  auto assigned = engine_->evaluate_expr(args.name + "=" + args.value, std::nullopt, value);
  if (!assigned) {
    reply_result(request, assigned);
    return;
  }
  reply(request, {{"value", value}, {"variablesReference", 0}});
}

void session_controller::handle_pause(const dap::request& request) {
  if (!require_engine(request)) {
    return;
  }

  auto paused = engine_->pause();
  if (!paused) {
    reply_result(request, paused);
    return;
  }
  if (tracker_.state() == execution_state::running) {
    tracker_.on_pause_acknowledged();
  }
  reply(request);
}

void session_controller::handle_terminate(const dap::request& request) { reply(request); }

void session_controller::handle_disconnect(const dap::request& request) {
  if (engine_) {
    engine_->shutdown();
  }
  tracker_.terminate();
  finished_ = true;
  reply(request);
}

bool session_controller::require_engine(const dap::request& request) {
  if (engine_) {
    return true;
  }
  reply_error(request, "no debugger is running");
  return false;
}

bool session_controller::target_running() const {
  return tracker_.requires_interrupt() && engine_ && !engine_->is_stopped();
}

result session_controller::ensure_stopped() {
  if (!target_running()) {
    return make_success_result();
  }

  log_.dbg("interrupting running target");
  auto paused = engine_->pause();
  if (!paused) {
    return paused;
  }
  tracker_.on_pause_acknowledged();
  return make_success_result();
}

void session_controller::reply(const dap::request& request, dap::json body) {
  sink_.send_response(dap::make_response(request, std::move(body)));
}

void session_controller::reply_error(const dap::request& request, const std::string& message) {
  log_.dbg("request failed", redlog::field("command", request.command), redlog::field("error", message));
  sink_.send_response(dap::make_error_response(request, message));
}

void session_controller::reply_result(const dap::request& request, const result& status) {
  if (status) {
    reply(request);
  } else {
    reply_error(request, status.error_message);
  }
}

} // namespace g1dap::session
