#pragma once

namespace g1dap::session {

enum class execution_state { running, stopped, paused, terminated };

const char* execution_state_name(execution_state state);

// running/stopped/paused state of the debugged target, driven by engine events
// and by acknowledgements of commands the session issued itself.
//
// the console bracket pauses and resumes the target behind the client's back;
// the stop and resume it causes are marked hidden beforehand so the router can
// swallow exactly those two events.
class execution_state_tracker {
public:
  execution_state state() const { return state_; }
  bool terminated() const { return state_ == execution_state::terminated; }
  bool requires_interrupt() const { return state_ == execution_state::running; }

  // engine events; each returns true when the client should see the transition
  bool on_running();
  bool on_stopped();
  bool on_paused();

  // acknowledgements of commands issued by the session
  void on_resume_acknowledged();
  void on_pause_acknowledged();

  void hide_next_pause() { ++hidden_pauses_; }
  void hide_next_resume() { ++hidden_resumes_; }
  void cancel_hidden_pause();
  void cancel_hidden_resume();

  // moves to the terminal state; true only for the first call
  bool terminate();

private:
  execution_state state_ = execution_state::stopped;
  int hidden_pauses_ = 0;
  int hidden_resumes_ = 0;
};

} // namespace g1dap::session
