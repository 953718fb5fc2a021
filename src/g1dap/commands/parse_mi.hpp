#pragma once

#include <string>

namespace g1dap::commands {

struct parse_mi_options {
  // empty reads stdin
  std::string input_path;
};

// prints the decoded structure of each gdb/mi line
int parse_mi(const parse_mi_options& options);

} // namespace g1dap::commands
