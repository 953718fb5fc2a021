#pragma once

#include <string>

namespace g1dap::commands {

struct serve_options {
  std::string debugger_path;
  bool trace = false;
};

// runs one debug session over stdin/stdout
int serve(const serve_options& options);

} // namespace g1dap::commands
