#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "g1dap/dap/protocol.hpp"
#include "g1dap/engine/types.hpp"

namespace g1dap::session {

// reference handed out for the single "Local" scope
constexpr int64_t k_local_scope_reference = 1000;

enum class evaluate_mode { console, expression };

// client frame ids are one-based, engine frames zero-based. 0 or absent means
// "no explicit frame" and stays absent.
std::optional<int64_t> to_engine_frame(std::optional<int64_t> client_frame);

// "hover" and "watch" query an expression; everything else runs on the console
evaluate_mode evaluate_mode_for(const std::string& context);

std::vector<engine::breakpoint_spec> to_breakpoint_specs(const std::vector<dap::source_breakpoint>& breakpoints);

engine::spawn_options to_spawn_options(const dap::launch_arguments& args, const std::string& default_debugger);
engine::spawn_options to_spawn_options(const dap::attach_arguments& args, const std::string& default_debugger);

int64_t total_frames(size_t frame_count);

dap::json breakpoints_body(const std::vector<engine::breakpoint_info>& breakpoints);
dap::json threads_body(const std::vector<engine::thread_info>& threads);
dap::json stack_trace_body(const std::vector<engine::frame_info>& frames);
dap::json scopes_body();
dap::json variables_body(const std::vector<engine::variable_info>& variables);
dap::json evaluate_body(const std::string& result);

} // namespace g1dap::session
