#include "event_router.hpp"

#include "g1dap/dap/protocol.hpp"
#include "console_text.hpp"

namespace g1dap::session {

const char* const k_fatal_error_message =
    "g1dap has encountered a fatal error. Please report this error along with the debugger log.";

event_router::event_router(client_sink& sink, execution_state_tracker& tracker)
    : sink_(sink), tracker_(tracker), log_(redlog::get_logger("g1dap.router")) {}

bool event_router::subscribe() {
  if (subscribed_) {
    return false;
  }
  subscribed_ = true;
  log_.dbg("subscribed to engine events");
  return true;
}

void event_router::route(const engine::engine_event& event) {
  if (debug_logging_) {
    log_.inf(
        "engine event", redlog::field("kind", engine::event_kind_name(event.kind)),
        redlog::field("thread", event.thread_id), redlog::field("text", event.text)
    );
  } else {
    log_.dbg(
        "engine event", redlog::field("kind", engine::event_kind_name(event.kind)),
        redlog::field("thread", event.thread_id)
    );
  }

  if (!subscribed_) {
    log_.wrn("dropping engine event before initialize", redlog::field("kind", engine::event_kind_name(event.kind)));
    return;
  }

  switch (event.kind) {
  case engine::event_kind::fatal_error:
    if (tracker_.terminate()) {
      log_.err("fatal engine error", redlog::field("detail", event.text));
      sink_.show_error(k_fatal_error_message);
      sink_.send_event(dap::make_terminated_event());
    }
    break;

  case engine::event_kind::output:
    sink_.send_event(dap::make_output_event(normalize_console_text(event.text), "console"));
    break;

  case engine::event_kind::running:
    if (tracker_.on_running()) {
      sink_.send_event(dap::make_continued_event(event.thread_id, event.all_threads));
    } else {
      log_.trc("suppressed resume", redlog::field("state", execution_state_name(tracker_.state())));
    }
    break;

  case engine::event_kind::breakpoint_hit:
    forward_stop("breakpoint", event.thread_id);
    break;

  case engine::event_kind::end_stepping_range:
    forward_stop("step", event.thread_id);
    break;

  case engine::event_kind::function_finished:
    forward_stop("step-out", event.thread_id);
    break;

  case engine::event_kind::signal_received:
    // the signal name is not surfaced
    forward_stop("pause", event.thread_id);
    break;

  case engine::event_kind::paused:
    if (tracker_.on_paused()) {
      sink_.send_event(dap::make_stopped_event("pause", 1));
    } else {
      log_.trc("suppressed pause", redlog::field("state", execution_state_name(tracker_.state())));
    }
    break;

  case engine::event_kind::exited_normally:
    forward_terminated();
    break;

  case engine::event_kind::error:
    sink_.show_error(event.text);
    break;
  }
}

void event_router::forward_stop(const char* reason, uint64_t thread_id) {
  if (tracker_.on_stopped()) {
    sink_.send_event(dap::make_stopped_event(reason, thread_id));
  }
}

void event_router::forward_terminated() {
  if (tracker_.terminate()) {
    log_.inf("debuggee exited");
    sink_.send_event(dap::make_terminated_event());
  }
}

} // namespace g1dap::session
