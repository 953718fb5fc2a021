#include "parse_mi.hpp"

#include <fstream>
#include <iostream>

#include <redlog.hpp>

#include "g1dap/mi/parser.hpp"

namespace g1dap::commands {

namespace {

void print_record(const mi::record& record, size_t line_number) {
  std::cout << line_number << ": " << mi::record_kind_name(record.kind);
  if (record.token) {
    std::cout << " token=" << *record.token;
  }
  if (!record.class_name.empty()) {
    std::cout << " class=" << record.class_name;
  }
  if (record.is_stream() || record.kind == mi::record_kind::unknown) {
    std::cout << " text=" << mi::quote(record.stream_text);
  } else if (!record.results.children.empty()) {
    std::cout << " results=" << mi::to_string(record.results);
  }
  std::cout << "\n";
}

} // namespace

int parse_mi(const parse_mi_options& options) {
  auto log = redlog::get_logger("g1dap.parse_mi");

  std::ifstream file;
  std::istream* input = &std::cin;
  if (!options.input_path.empty()) {
    file.open(options.input_path);
    if (!file) {
      log.err("failed to open input", redlog::field("path", options.input_path));
      std::cerr << "error: cannot open " << options.input_path << std::endl;
      return 1;
    }
    input = &file;
  }

  size_t line_number = 0;
  size_t unknown = 0;
  std::string line;
  while (std::getline(*input, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    mi::record record = mi::parse_line(line);
    if (record.kind == mi::record_kind::unknown) {
      ++unknown;
    }
    print_record(record, line_number);
  }

  log.dbg("parsed input", redlog::field("lines", line_number), redlog::field("unknown", unknown));
  return 0;
}

} // namespace g1dap::commands
