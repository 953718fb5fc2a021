#pragma once

#include <istream>
#include <mutex>
#include <ostream>
#include <string>

#include <redlog.hpp>

#include "g1dap/error.hpp"
#include "protocol.hpp"

namespace g1dap::dap {

// Content-Length framed messages over a pair of streams. one reader at a
// time; writes are serialized.
class transport {
public:
  transport(std::istream& in, std::ostream& out);

  // io_error with eof() set once the input is exhausted
  result read(std::string& payload);
  result write(const json& message);

  bool eof() const { return eof_; }

private:
  std::istream& in_;
  std::ostream& out_;
  std::mutex write_mutex_;
  redlog::logger log_;
  bool eof_ = false;
};

} // namespace g1dap::dap
