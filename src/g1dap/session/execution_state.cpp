#include "execution_state.hpp"

namespace g1dap::session {

const char* execution_state_name(execution_state state) {
  switch (state) {
  case execution_state::running:
    return "running";
  case execution_state::stopped:
    return "stopped";
  case execution_state::paused:
    return "paused";
  case execution_state::terminated:
    return "terminated";
  default:
    return "unknown";
  }
}

bool execution_state_tracker::on_running() {
  if (terminated()) {
    return false;
  }
  state_ = execution_state::running;
  if (hidden_resumes_ > 0) {
    --hidden_resumes_;
    return false;
  }
  return true;
}

bool execution_state_tracker::on_stopped() {
  if (terminated()) {
    return false;
  }
  state_ = execution_state::stopped;
  // a real stop won the race against our interrupt, which then never reports
  hidden_pauses_ = 0;
  return true;
}

bool execution_state_tracker::on_paused() {
  if (terminated()) {
    return false;
  }
  state_ = execution_state::paused;
  if (hidden_pauses_ > 0) {
    --hidden_pauses_;
    return false;
  }
  return true;
}

void execution_state_tracker::on_resume_acknowledged() {
  if (!terminated()) {
    state_ = execution_state::running;
  }
}

void execution_state_tracker::on_pause_acknowledged() {
  if (!terminated()) {
    state_ = execution_state::paused;
  }
}

void execution_state_tracker::cancel_hidden_pause() {
  if (hidden_pauses_ > 0) {
    --hidden_pauses_;
  }
}

void execution_state_tracker::cancel_hidden_resume() {
  if (hidden_resumes_ > 0) {
    --hidden_resumes_;
  }
}

bool execution_state_tracker::terminate() {
  if (terminated()) {
    return false;
  }
  state_ = execution_state::terminated;
  hidden_pauses_ = 0;
  hidden_resumes_ = 0;
  return true;
}

} // namespace g1dap::session
