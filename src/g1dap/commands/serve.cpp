#include "serve.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include <redlog.hpp>

#include "g1dap/dap/server.hpp"
#include "g1dap/dap/transport.hpp"
#include "g1dap/engine/mi_executor.hpp"
#include "g1dap/session/session_controller.hpp"

namespace g1dap::commands {

int serve(const serve_options& options) {
  auto log = redlog::get_logger("g1dap.serve");

  // writes to a closed debugger or client pipe fail with EPIPE
  std::signal(SIGPIPE, SIG_IGN);
  std::ios::sync_with_stdio(false);

  log.inf(
      "serving debug adapter on stdio", redlog::field("debugger", options.debugger_path),
      redlog::field("trace", options.trace)
  );

  dap::transport wire(std::cin, std::cout);
  dap::server client(wire);

  session::session_controller::config config;
  config.default_debugger = options.debugger_path;
  config.debug_logging = options.trace;
  config.make_engine = [](engine::engine_executor::event_callback on_event) {
    return std::make_unique<engine::mi_executor>(std::move(on_event));
  };

  session::session_controller controller(std::move(config), client);
  std::thread session_thread([&controller]() { controller.run(); });

  client.serve_requests(controller);
  controller.post_close();
  session_thread.join();

  log.inf("debug adapter finished");
  return 0;
}

} // namespace g1dap::commands
