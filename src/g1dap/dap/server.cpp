#include "server.hpp"

#include "g1dap/session/session_controller.hpp"

namespace g1dap::dap {

server::server(transport& wire) : wire_(wire), log_(redlog::get_logger("g1dap.dap")) {}

void server::send_response(const response& value) { send(to_json(value, next_seq())); }

void server::send_event(const event& value) { send(to_json(value, next_seq())); }

void server::show_error(const std::string& message) {
  log_.err("user error", redlog::field("message", message));
  send_event(make_output_event(message + "\n", "important"));
}

void server::send(const json& message) {
  auto written = wire_.write(message);
  if (!written) {
    log_.err("failed to send message", redlog::field("error", written.error_message));
  }
}

void server::serve_requests(session::session_controller& controller) {
  while (!controller.finished()) {
    std::string payload;
    auto status = wire_.read(payload);
    if (!status) {
      if (wire_.eof()) {
        log_.dbg("client closed input", redlog::field("detail", status.error_message));
      } else {
        // framing is lost, nothing after this can be trusted
        log_.err("client read failed", redlog::field("error", status.error_message));
      }
      break;
    }

    json message;
    try {
      message = json::parse(payload);
    } catch (const json::parse_error& e) {
      log_.err("dropping malformed message", redlog::field("error", e.what()));
      continue;
    }

    request req;
    auto parsed = parse_request(message, req);
    if (!parsed) {
      log_.wrn("ignoring message", redlog::field("error", parsed.error_message));
      if (!req.command.empty()) {
        send_response(make_error_response(req, parsed.error_message));
      }
      continue;
    }

    controller.post_request(std::move(req));
  }
}

} // namespace g1dap::dap
