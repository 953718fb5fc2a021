#pragma once

#include <string>
#include <string_view>

namespace g1dap::session {

// turns a raw engine stream line into debug console text, newline terminated.
// escaped newlines are dropped rather than expanded, so multi-line stream
// output is joined into one line.
std::string normalize_console_text(std::string_view raw);

} // namespace g1dap::session
