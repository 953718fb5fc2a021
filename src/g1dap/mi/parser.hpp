#pragma once

#include <string>
#include <string_view>

#include "record.hpp"

namespace g1dap::mi {

// parses one line of debugger output; never fails, unrecognized input yields record_kind::unknown
record parse_line(std::string_view line);

// quotes text as an mi c-string for use as a command argument
std::string quote(std::string_view text);

// renders a value back in mi syntax
std::string to_string(const value& v);

} // namespace g1dap::mi
