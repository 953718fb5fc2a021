#pragma once

#include <string>

#include "g1dap/dap/protocol.hpp"

namespace g1dap::session {

// everything the session sends towards the client
class client_sink {
public:
  virtual ~client_sink() = default;

  virtual void send_response(const dap::response& response) = 0;
  virtual void send_event(const dap::event& event) = 0;
  // user-visible error notification
  virtual void show_error(const std::string& message) = 0;
};

} // namespace g1dap::session
