#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace g1dap::mi {

// one gdb/mi value: a c-string, a tuple {a=..} or a list [..]
// tuple members and result-list members carry their variable name in `name`
struct value {
  enum class kind { string, tuple, list };

  kind type = kind::string;
  std::string name;
  std::string text;
  std::vector<value> children;

  const value* find(std::string_view key) const {
    for (const auto& child : children) {
      if (child.name == key) {
        return &child;
      }
    }
    return nullptr;
  }

  std::string string_of(std::string_view key, std::string default_value = "") const {
    const value* child = find(key);
    if (!child || child->type != kind::string) {
      return default_value;
    }
    return child->text;
  }

  std::optional<uint64_t> number_of(std::string_view key) const;
};

enum class record_kind {
  result,
  exec_async,
  status_async,
  notify_async,
  console_stream,
  target_stream,
  log_stream,
  prompt,
  unknown,
};

struct record {
  std::optional<uint64_t> token;
  record_kind kind = record_kind::unknown;
  std::string class_name;
  value results{value::kind::tuple, "", "", {}};
  std::string stream_text;
  std::string raw;

  bool is_stream() const {
    return kind == record_kind::console_stream || kind == record_kind::target_stream ||
           kind == record_kind::log_stream;
  }
  bool is_async() const {
    return kind == record_kind::exec_async || kind == record_kind::status_async ||
           kind == record_kind::notify_async;
  }
  bool is_error() const { return kind == record_kind::result && class_name == "error"; }
  std::string error_message() const { return results.string_of("msg", "unknown debugger error"); }
};

const char* record_kind_name(record_kind kind);

} // namespace g1dap::mi
