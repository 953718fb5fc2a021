#pragma once

#include <string>

#include <redlog.hpp>

#include "g1dap/engine/types.hpp"
#include "client_sink.hpp"
#include "execution_state.hpp"

namespace g1dap::session {

extern const char* const k_fatal_error_message;

// maps each engine event to at most one client notification. events are only
// routed once the session has subscribed, which happens during initialize.
class event_router {
public:
  event_router(client_sink& sink, execution_state_tracker& tracker);

  // idempotent; returns false when already subscribed
  bool subscribe();
  bool subscribed() const { return subscribed_; }

  void set_debug_logging(bool enabled) { debug_logging_ = enabled; }

  void route(const engine::engine_event& event);

private:
  void forward_stop(const char* reason, uint64_t thread_id);
  void forward_terminated();

  client_sink& sink_;
  execution_state_tracker& tracker_;
  redlog::logger log_;
  bool subscribed_ = false;
  bool debug_logging_ = false;
};

} // namespace g1dap::session
