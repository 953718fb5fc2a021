#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "g1dap/error.hpp"
#include "g1dap/mi/record.hpp"
#include "types.hpp"

namespace g1dap::engine {

// owns one debugger process. every operation blocks the caller until the
// engine acknowledges it; asynchronous engine events go to the callback given
// at construction, possibly from another thread.
class engine_executor {
public:
  using event_callback = std::function<void(engine_event)>;

  virtual ~engine_executor() = default;

  virtual result spawn(const spawn_options& options) = 0;
  virtual result start_inferior() = 0;
  virtual result attach_inferior() = 0;

  virtual result clear_breakpoints() = 0;
  virtual result set_breakpoints(
      const std::string& source_path, const std::vector<breakpoint_spec>& specs, std::vector<breakpoint_info>& out
  ) = 0;

  virtual result get_threads(std::vector<thread_info>& out) = 0;
  virtual result get_stack(uint64_t thread_id, std::vector<frame_info>& out) = 0;
  virtual result get_vars(int64_t variables_reference, std::vector<variable_info>& out) = 0;

  virtual result next(std::optional<uint64_t> thread_id) = 0;
  virtual result step_in(std::optional<uint64_t> thread_id) = 0;
  virtual result step_out(std::optional<uint64_t> thread_id) = 0;
  virtual result continue_execution(std::optional<uint64_t> thread_id) = 0;
  virtual result pause() = 0;
  virtual bool is_stopped() const = 0;

  // raw console command; an engine-side error is returned in `out`, not as a failure
  virtual result exec_user_cmd(const std::string& command, std::optional<int64_t> frame, mi::record& out) = 0;
  virtual result evaluate_expr(const std::string& expression, std::optional<int64_t> frame, std::string& out) = 0;

  virtual void shutdown() = 0;
};

using engine_factory = std::function<std::unique_ptr<engine_executor>(engine_executor::event_callback)>;

} // namespace g1dap::engine
