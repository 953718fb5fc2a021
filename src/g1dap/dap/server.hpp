#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include <redlog.hpp>

#include "g1dap/session/client_sink.hpp"
#include "transport.hpp"

namespace g1dap::session {
class session_controller;
}

namespace g1dap::dap {

// client side of a session: numbers and frames outgoing messages and feeds
// decoded requests to the session controller
class server final : public session::client_sink {
public:
  explicit server(transport& wire);

  void send_response(const response& value) override;
  void send_event(const event& value) override;
  void show_error(const std::string& message) override;

  // reads requests until end of input or until the session finishes
  void serve_requests(session::session_controller& controller);

private:
  void send(const json& message);
  int64_t next_seq() { return ++seq_; }

  transport& wire_;
  redlog::logger log_;
  std::atomic<int64_t> seq_{0};
};

} // namespace g1dap::dap
