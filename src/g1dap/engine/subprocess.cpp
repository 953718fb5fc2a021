#include "subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <redlog.hpp>

namespace g1dap::engine {

namespace {

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

} // namespace

subprocess::~subprocess() {
  terminate();
  close();
}

result subprocess::start(const std::vector<std::string>& argv) {
  auto log = redlog::get_logger("g1dap.subprocess");

  if (argv.empty() || argv.front().empty()) {
    return make_error_result(error_code::invalid_argument, "empty command line");
  }
  if (started()) {
    return make_error_result(error_code::invalid_state, "process already started");
  }

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
    int err = errno;
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], status_pipe[0], status_pipe[1]}) {
      if (fd >= 0) {
        ::close(fd);
      }
    }
    log.error("failed to create pipes", redlog::field("errno", err));
    return make_error_result(error_code::spawn_failed, "pipe failed", err);
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  log.debug("launching process", redlog::field("path", argv.front()), redlog::field("argc", argv.size()));

  pid_t child_pid = fork();
  if (child_pid == 0) {
    // child process: only async-signal-safe calls from here on
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(out_pipe[1], STDERR_FILENO);
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    ::close(status_pipe[0]);
    setpgid(0, 0);
    execvp(args[0], args.data());
    // execvp only returns on error
    int err = errno;
    (void) !write(status_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  ::close(status_pipe[1]);

  if (child_pid < 0) {
    int err = errno;
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    ::close(status_pipe[0]);
    log.error("fork failed", redlog::field("errno", err));
    return make_error_result(error_code::spawn_failed, "fork failed", err);
  }

  // the status pipe closes on a successful exec, otherwise it carries errno
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(status_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    waitpid(child_pid, &status, 0);
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    log.error(
        "failed to execute process", redlog::field("path", argv.front()), redlog::field("errno", child_errno)
    );
    return make_error_result(
        error_code::spawn_failed, "cannot execute '" + argv.front() + "': " + std::strerror(child_errno)
    );
  }

  pid_ = child_pid;
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  reaped_ = false;
  buffer_.clear();

  log.info("process started", redlog::field("path", argv.front()), redlog::field("pid", pid_));
  return make_success_result();
}

result subprocess::write_line(const std::string& line) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (stdin_fd_ < 0) {
    return make_error_result(error_code::engine_exited, "process input is closed");
  }

  std::string data = line;
  data.push_back('\n');
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return make_error_result(error_code::io_error, "write to debugger failed", errno);
    }
    written += static_cast<size_t>(n);
  }
  return make_success_result();
}

bool subprocess::read_line(std::string& out) {
  if (stdout_fd_ < 0) {
    return false;
  }

  for (;;) {
    size_t newline = buffer_.find('\n');
    if (newline != std::string::npos) {
      out = buffer_.substr(0, newline);
      buffer_.erase(0, newline + 1);
      return true;
    }

    char chunk[4096];
    ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      // hand out a trailing partial line before reporting eof
      if (buffer_.empty()) {
        return false;
      }
      out = std::move(buffer_);
      buffer_.clear();
      return true;
    }
    buffer_.append(chunk, static_cast<size_t>(n));
  }
}

void subprocess::terminate() {
  if (pid_ <= 0 || reaped_) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    close_fd(stdin_fd_);
  }

  int status = 0;
  if (waitpid(pid_, &status, WNOHANG) == 0) {
    kill(pid_, SIGTERM);
    waitpid(pid_, &status, 0);
  }
  reaped_ = true;
}

void subprocess::close() {
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    close_fd(stdin_fd_);
  }
  close_fd(stdout_fd_);
  buffer_.clear();
}

} // namespace g1dap::engine
