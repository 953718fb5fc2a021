#include "parser.hpp"

#include <cctype>
#include <utility>

#include "g1dap/util/string_utils.hpp"

namespace g1dap::mi {

std::optional<uint64_t> value::number_of(std::string_view key) const {
  return util::parse_decimal<uint64_t>(string_of(key));
}

const char* record_kind_name(record_kind kind) {
  switch (kind) {
  case record_kind::result:
    return "result";
  case record_kind::exec_async:
    return "exec";
  case record_kind::status_async:
    return "status";
  case record_kind::notify_async:
    return "notify";
  case record_kind::console_stream:
    return "console";
  case record_kind::target_stream:
    return "target";
  case record_kind::log_stream:
    return "log";
  case record_kind::prompt:
    return "prompt";
  case record_kind::unknown:
  default:
    return "unknown";
  }
}

namespace {

class line_parser {
public:
  explicit line_parser(std::string_view text) : text_(text) {}

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }
  size_t position() const { return pos_; }
  void advance() { ++pos_; }

  bool consume(char ch) {
    if (peek() != ch) {
      return false;
    }
    ++pos_;
    return true;
  }

  std::optional<uint64_t> parse_token() {
    size_t start = pos_;
    while (!at_end() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
    if (pos_ == start) {
      return std::nullopt;
    }
    auto token = util::parse_decimal<uint64_t>(text_.substr(start, pos_ - start));
    if (!token) {
      // too long for a token, so the line is plain output
      pos_ = start;
    }
    return token;
  }

  std::string parse_word() {
    size_t start = pos_;
    while (!at_end()) {
      char ch = text_[pos_];
      if (ch == ',' || ch == '=' || ch == '{' || ch == '}' || ch == '[' || ch == ']' || ch == '"') {
        break;
      }
      ++pos_;
    }
    return std::string(text_.substr(start, pos_ - start));
  }

  std::string parse_c_string() {
    std::string out;
    if (!consume('"')) {
      return out;
    }
    while (!at_end()) {
      char ch = text_[pos_++];
      if (ch == '"') {
        return out;
      }
      if (ch != '\\' || at_end()) {
        out.push_back(ch);
        continue;
      }
      char esc = text_[pos_++];
      switch (esc) {
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'v':
        out.push_back('\v');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'a':
        out.push_back('\a');
        break;
      case 'e':
        out.push_back('\x1b');
        break;
      case '0':
      case '1':
      case '2':
      case '3':
      case '4':
      case '5':
      case '6':
      case '7': {
        // up to three octal digits
        int code = esc - '0';
        for (int i = 0; i < 2 && !at_end() && text_[pos_] >= '0' && text_[pos_] <= '7'; ++i) {
          code = code * 8 + (text_[pos_++] - '0');
        }
        out.push_back(static_cast<char>(code));
        break;
      }
      default:
        out.push_back(esc);
        break;
      }
    }
    return out;
  }

  value parse_value() {
    char ch = peek();
    if (ch == '"') {
      value v;
      v.text = parse_c_string();
      return v;
    }
    if (ch == '{') {
      return parse_tuple();
    }
    if (ch == '[') {
      return parse_list();
    }
    // not valid mi, but some debuggers emit bare constants
    value v;
    v.text = parse_word();
    return v;
  }

  // variable=value, or a bare value inside a list
  value parse_result() {
    size_t start = pos_;
    std::string name = parse_word();
    if (consume('=')) {
      value v = parse_value();
      v.name = std::move(name);
      return v;
    }
    pos_ = start;
    return parse_value();
  }

  void parse_results_into(value& target, char terminator) {
    while (!at_end() && peek() != terminator) {
      size_t before = pos_;
      value item = parse_result();
      if (pos_ == before) {
        // stray delimiter, skip it
        advance();
        continue;
      }
      target.children.push_back(std::move(item));
      if (!consume(',')) {
        break;
      }
    }
  }

  value parse_tuple() {
    value v;
    v.type = value::kind::tuple;
    consume('{');
    parse_results_into(v, '}');
    consume('}');
    return v;
  }

  value parse_list() {
    value v;
    v.type = value::kind::list;
    consume('[');
    parse_results_into(v, ']');
    consume(']');
    return v;
  }

  std::string rest() const { return at_end() ? std::string() : std::string(text_.substr(pos_)); }

private:
  std::string_view text_;
  size_t pos_ = 0;
};

record_kind kind_from_prefix(char prefix) {
  switch (prefix) {
  case '^':
    return record_kind::result;
  case '*':
    return record_kind::exec_async;
  case '+':
    return record_kind::status_async;
  case '=':
    return record_kind::notify_async;
  case '~':
    return record_kind::console_stream;
  case '@':
    return record_kind::target_stream;
  case '&':
    return record_kind::log_stream;
  default:
    return record_kind::unknown;
  }
}

} // namespace

record parse_line(std::string_view line) {
  record rec;
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  rec.raw = std::string(line);

  std::string_view trimmed = util::trim_view(line);
  if (trimmed == "(gdb)") {
    rec.kind = record_kind::prompt;
    return rec;
  }

  line_parser parser(line);
  auto token = parser.parse_token();
  record_kind kind = kind_from_prefix(parser.peek());
  if (kind == record_kind::unknown) {
    // plain inferior output sharing the pipe
    rec.stream_text = rec.raw;
    return rec;
  }
  parser.advance();
  rec.token = token;
  rec.kind = kind;

  if (rec.is_stream()) {
    if (parser.peek() == '"') {
      rec.stream_text = parser.parse_c_string();
    } else {
      rec.stream_text = parser.rest();
    }
    return rec;
  }

  rec.class_name = parser.parse_word();
  if (parser.consume(',')) {
    parser.parse_results_into(rec.results, '\0');
  }
  return rec;
}

std::string quote(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('"');
  for (char ch : text) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  out.push_back('"');
  return out;
}

std::string to_string(const value& v) {
  std::string out;
  if (!v.name.empty()) {
    out += v.name;
    out += '=';
  }
  switch (v.type) {
  case value::kind::string:
    out += quote(v.text);
    break;
  case value::kind::tuple:
  case value::kind::list: {
    out += v.type == value::kind::tuple ? '{' : '[';
    for (size_t i = 0; i < v.children.size(); ++i) {
      if (i != 0) {
        out += ',';
      }
      out += to_string(v.children[i]);
    }
    out += v.type == value::kind::tuple ? '}' : ']';
    break;
  }
  }
  return out;
}

} // namespace g1dap::mi
