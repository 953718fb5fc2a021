#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <redlog.hpp>

#include "g1dap/dap/protocol.hpp"
#include "g1dap/engine/engine_executor.hpp"
#include "client_sink.hpp"
#include "command_translator.hpp"
#include "event_router.hpp"
#include "execution_state.hpp"
#include "inbox.hpp"

namespace g1dap::session {

enum class session_mode { none, launch, attach };

const char* session_mode_name(session_mode mode);

// one debug session. client requests and engine events are queued in a single
// inbox and handled one at a time on the thread that calls run(); requests
// are never pipelined, so a request handler may block on the engine and issue
// several engine commands without interleaving with another request.
class session_controller {
public:
  struct config {
    std::string default_debugger = "gdb";
    bool debug_logging = false;
    engine::engine_factory make_engine;
  };

  session_controller(config config, client_sink& sink);
  ~session_controller();

  session_controller(const session_controller&) = delete;
  session_controller& operator=(const session_controller&) = delete;

  // producers, callable from any thread
  void post_request(dap::request request);
  void post_event(engine::engine_event event);
  // no more client input; run() returns once the inbox is drained
  void post_close();

  // dispatch loop; returns after disconnect or once closed and drained
  void run();

  // handles one queued message without blocking; false when the inbox is empty
  bool dispatch_next();
  void dispatch(const session_message& message);

  void handle_request(const dap::request& request);
  void handle_event(const engine::engine_event& event);

  bool initialized() const { return initialized_; }
  bool finished() const { return finished_.load(); }
  session_mode mode() const { return mode_; }
  execution_state state() const { return tracker_.state(); }

private:
  using request_handler = void (session_controller::*)(const dap::request&);
  static request_handler find_handler(const std::string& command);

  void handle_initialize(const dap::request& request);
  void handle_launch(const dap::request& request);
  void handle_attach(const dap::request& request);
  void handle_configuration_done(const dap::request& request);
  void handle_set_breakpoints(const dap::request& request);
  void handle_threads(const dap::request& request);
  void handle_stack_trace(const dap::request& request);
  void handle_scopes(const dap::request& request);
  void handle_variables(const dap::request& request);
  void handle_next(const dap::request& request);
  void handle_step_in(const dap::request& request);
  void handle_step_out(const dap::request& request);
  void handle_continue(const dap::request& request);
  void handle_evaluate(const dap::request& request);
  void handle_set_variable(const dap::request& request);
  void handle_pause(const dap::request& request);
  void handle_terminate(const dap::request& request);
  void handle_disconnect(const dap::request& request);

  result start_engine(const engine::spawn_options& options);
  void fail_start(const dap::request& request, const std::string& message);
  bool require_engine(const dap::request& request);
  bool target_running() const;
  result ensure_stopped();
  result run_console_bracket(const std::string& command, std::optional<int64_t> frame, mi::record& out);

  void reply(const dap::request& request, dap::json body = dap::json::object());
  void reply_error(const dap::request& request, const std::string& message);
  void reply_result(const dap::request& request, const result& status);

  config config_;
  client_sink& sink_;
  redlog::logger log_;
  execution_state_tracker tracker_{};
  event_router router_;
  inbox inbox_{};
  // destroyed before inbox_, which its reader thread posts into
  std::unique_ptr<engine::engine_executor> engine_;
  session_mode mode_ = session_mode::none;
  bool initialized_ = false;
  std::atomic<bool> finished_{false};
};

} // namespace g1dap::session
