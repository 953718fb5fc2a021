#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <redlog.hpp>

#include "engine_executor.hpp"
#include "subprocess.hpp"

namespace g1dap::engine {

// engine_executor over a gdb/mi subprocess. commands carry numeric tokens and
// the calling thread waits for the result record with the same token; a
// reader thread parses every output line and turns async records into events.
class mi_executor final : public engine_executor {
public:
  explicit mi_executor(event_callback on_event);
  ~mi_executor() override;

  result spawn(const spawn_options& options) override;
  result start_inferior() override;
  result attach_inferior() override;

  result clear_breakpoints() override;
  result set_breakpoints(
      const std::string& source_path, const std::vector<breakpoint_spec>& specs, std::vector<breakpoint_info>& out
  ) override;

  result get_threads(std::vector<thread_info>& out) override;
  result get_stack(uint64_t thread_id, std::vector<frame_info>& out) override;
  result get_vars(int64_t variables_reference, std::vector<variable_info>& out) override;

  result next(std::optional<uint64_t> thread_id) override;
  result step_in(std::optional<uint64_t> thread_id) override;
  result step_out(std::optional<uint64_t> thread_id) override;
  result continue_execution(std::optional<uint64_t> thread_id) override;
  result pause() override;
  bool is_stopped() const override;

  result exec_user_cmd(const std::string& command, std::optional<int64_t> frame, mi::record& out) override;
  result evaluate_expr(const std::string& expression, std::optional<int64_t> frame, std::string& out) override;

  void shutdown() override;

private:
  struct pending_command {
    bool done = false;
    mi::record result;
  };

  // waits for any result record; engine-side ^error is not a failure here
  result send_command(const std::string& command, mi::record& out);
  // like send_command, but ^error becomes a failed result
  result execute(const std::string& command, mi::record& out);
  result execute(const std::string& command);
  result resume(const char* command, std::optional<uint64_t> thread_id);

  void reader_loop();
  void handle_record(mi::record record);
  void handle_result(mi::record record);
  void handle_exec_async(const mi::record& record);
  void emit(engine_event event);

  std::string frame_options(std::optional<int64_t> frame) const;

  event_callback on_event_;
  redlog::logger log_;
  subprocess process_;
  std::thread reader_;
  spawn_options options_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  uint64_t next_token_ = 1;
  std::unordered_map<uint64_t, pending_command> pending_;
  uint64_t current_thread_ = 0;
  bool stopped_ = true;
  bool interrupt_pending_ = false;
  bool exited_ = false;
  bool stopping_ = false;
};

} // namespace g1dap::engine
