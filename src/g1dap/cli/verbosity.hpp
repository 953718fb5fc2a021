#pragma once

#include <algorithm>

#include <redlog.hpp>

#include "g1dap/util/env_config.hpp"

namespace g1dap::cli {

// -v count to log level; each step shows more
inline redlog::level level_from_verbosity(int count) {
  static constexpr redlog::level levels[] = {
      redlog::level::info, redlog::level::verbose, redlog::level::trace, redlog::level::debug, redlog::level::pedantic,
  };
  constexpr int last = static_cast<int>(sizeof(levels) / sizeof(levels[0])) - 1;
  return levels[std::clamp(count, 0, last)];
}

// the command line wins; without any -v, G1DAP_VERBOSE supplies the count
inline int effective_verbosity(int flag_count, bool flag_given) {
  if (flag_given) {
    return flag_count;
  }
  util::env_config env("G1DAP");
  return env.get<int>("VERBOSE", 0);
}

inline void apply_verbosity(int flag_count, bool flag_given) {
  redlog::set_level(level_from_verbosity(effective_verbosity(flag_count, flag_given)));
}

} // namespace g1dap::cli
