#include "transport.hpp"

#include "g1dap/util/string_utils.hpp"

namespace g1dap::dap {

namespace {

constexpr std::string_view k_content_length = "content-length:";
constexpr const char* k_header_end = "\r\n\r\n";
constexpr int64_t k_max_content_length = 64 * 1024 * 1024;

} // namespace

transport::transport(std::istream& in, std::ostream& out)
    : in_(in), out_(out), log_(redlog::get_logger("g1dap.dap")) {}

result transport::read(std::string& payload) {
  long long content_length = -1;

  while (true) {
    std::string line;
    if (!std::getline(in_, line)) {
      eof_ = in_.eof();
      if (eof_ && line.empty() && content_length < 0) {
        return make_error_result(error_code::io_error, "end of input");
      }
      return make_error_result(error_code::io_error, "truncated message header");
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      if (content_length < 0) {
        return make_error_result(error_code::protocol_error, "missing Content-Length header");
      }
      break;
    }

    log_.ped("header", redlog::field("line", line));

    std::string lowered = util::to_lower(line);
    if (!util::starts_with(lowered, k_content_length)) {
      continue;
    }
    std::string value = util::trim_copy(std::string_view(line).substr(k_content_length.size()));
    if (!util::is_decimal(value) || value.size() > 12) {
      return make_error_result(error_code::protocol_error, "bad Content-Length '" + value + "'");
    }
    if (content_length >= 0) {
      log_.wrn("duplicate Content-Length header", redlog::field("line", line));
    }
    auto length = util::parse_decimal<int64_t>(value);
    if (!length || *length > k_max_content_length) {
      return make_error_result(error_code::protocol_error, "Content-Length too large '" + value + "'");
    }
    content_length = *length;
  }

  payload.assign(static_cast<size_t>(content_length), '\0');
  if (content_length > 0 && !in_.read(payload.data(), content_length)) {
    eof_ = in_.eof();
    return make_error_result(error_code::io_error, "truncated message body");
  }
  log_.trc("received", redlog::field("message", payload));
  return make_success_result();
}

result transport::write(const json& message) {
  std::string payload;
  try {
    payload = message.dump();
  } catch (const json::type_error& e) {
    // invalid utf-8 in a string value
    payload = message.dump(-1, ' ', false, json::error_handler_t::replace);
    log_.wrn("replaced invalid utf-8 in outgoing message", redlog::field("error", e.what()));
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  out_ << "Content-Length: " << payload.size() << k_header_end << payload;
  out_.flush();
  if (!out_) {
    return make_error_result(error_code::io_error, "failed to write message");
  }
  log_.trc("sent", redlog::field("message", payload));
  return make_success_result();
}

} // namespace g1dap::dap
