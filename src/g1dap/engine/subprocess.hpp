#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

#include "g1dap/error.hpp"

namespace g1dap::engine {

// child process with piped stdin and a combined stdout/stderr pipe.
// read_line is meant for a single reader thread; write_line may be called from any thread.
class subprocess {
public:
  subprocess() = default;
  ~subprocess();

  subprocess(const subprocess&) = delete;
  subprocess& operator=(const subprocess&) = delete;

  result start(const std::vector<std::string>& argv);

  bool started() const { return pid_ > 0; }
  pid_t pid() const { return pid_; }

  result write_line(const std::string& line);
  bool read_line(std::string& out);

  // signals the child and reaps it; pipes stay open until close()
  void terminate();
  void close();

private:
  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  bool reaped_ = false;
  std::string buffer_;
  std::mutex write_mutex_;
};

} // namespace g1dap::engine
