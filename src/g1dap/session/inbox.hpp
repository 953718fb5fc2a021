#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <variant>

#include "g1dap/dap/protocol.hpp"
#include "g1dap/engine/types.hpp"

namespace g1dap::session {

using session_message = std::variant<dap::request, engine::engine_event>;

// multi-producer, single-consumer fifo feeding the session dispatch loop
class inbox {
public:
  void push(session_message message) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return;
      }
      messages_.push_back(std::move(message));
    }
    cv_.notify_one();
  }

  bool poll(session_message& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (messages_.empty()) {
      return false;
    }
    out = std::move(messages_.front());
    messages_.pop_front();
    return true;
  }

  // blocks until a message arrives; false once closed and drained
  bool wait(session_message& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !messages_.empty(); });
    if (messages_.empty()) {
      return false;
    }
    out = std::move(messages_.front());
    messages_.pop_front();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
  }

private:
  mutable std::mutex mutex_{};
  std::condition_variable cv_{};
  std::deque<session_message> messages_{};
  bool closed_ = false;
};

} // namespace g1dap::session
