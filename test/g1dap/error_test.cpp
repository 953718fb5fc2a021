#include <doctest/doctest.h>

#include "g1dap/error.hpp"

using namespace g1dap;

TEST_CASE("g1dap error results carry the category and context") {
  auto ok = make_success_result();
  CHECK(ok.success());
  CHECK(static_cast<bool>(ok));

  auto failed = make_error_result(error_code::spawn_failed, "cannot execute 'gdb'", 2);
  CHECK_FALSE(failed.success());
  CHECK(failed.error_message == "failed to start debugger: cannot execute 'gdb' (system error: 2)");
  REQUIRE(failed.system_error_code.has_value());
  CHECK(*failed.system_error_code == 2);

  auto bare = make_error_result(error_code::invalid_state);
  CHECK(bare.error_message == "invalid state");
  CHECK_FALSE(bare.system_error_code.has_value());
}

TEST_CASE("g1dap engine errors keep the engine's text") {
  auto failed = make_engine_error("No symbol table is loaded.");
  CHECK(failed.code == error_code::engine_error);
  CHECK(failed.error_message == "No symbol table is loaded.");
}
