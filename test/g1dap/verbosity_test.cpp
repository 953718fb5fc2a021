#include <doctest/doctest.h>

#include <cstdlib>

#include "g1dap/cli/verbosity.hpp"

using namespace g1dap;

TEST_CASE("g1dap verbosity maps -v counts to log levels") {
  CHECK(cli::level_from_verbosity(0) == redlog::level::info);
  CHECK(cli::level_from_verbosity(1) == redlog::level::verbose);
  CHECK(cli::level_from_verbosity(2) == redlog::level::trace);
  CHECK(cli::level_from_verbosity(3) == redlog::level::debug);
  CHECK(cli::level_from_verbosity(4) == redlog::level::pedantic);
  CHECK(cli::level_from_verbosity(9) == redlog::level::pedantic);
  CHECK(cli::level_from_verbosity(-1) == redlog::level::info);
}

TEST_CASE("g1dap verbosity falls back to the environment") {
  ::setenv("G1DAP_VERBOSE", "2", 1);
  CHECK(cli::effective_verbosity(0, false) == 2);
  CHECK(cli::effective_verbosity(1, true) == 1);
  ::unsetenv("G1DAP_VERBOSE");
  CHECK(cli::effective_verbosity(0, false) == 0);
}
