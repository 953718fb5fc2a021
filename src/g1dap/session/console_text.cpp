#include "console_text.hpp"

#include <cctype>

#include "g1dap/util/string_utils.hpp"

namespace g1dap::session {

std::string normalize_console_text(std::string_view raw) {
  std::string text(raw.begin(), raw.end());

  // leading ~" and an optional numeric token
  if (util::starts_with(text, "~\"")) {
    size_t end = 2;
    while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) {
      ++end;
    }
    text.erase(0, end);
  }

  util::replace_all(text, "&\"", "");

  for (int i = 0; i < 2; ++i) {
    if (!text.empty() && text.back() == '"') {
      text.pop_back();
    }
  }

  util::replace_all(text, "\\n", "");
  util::replace_all(text, "\\r", "");
  util::replace_all(text, "\\t", "\t");
  util::replace_all(text, "\\v", "\v");
  util::replace_all(text, "\\\"", "\"");
  util::replace_all(text, "\\'", "'");
  util::replace_all(text, "\\\\", "\\");

  text.push_back('\n');
  return text;
}

} // namespace g1dap::session
