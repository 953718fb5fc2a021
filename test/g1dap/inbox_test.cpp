#include <doctest/doctest.h>

#include <thread>

#include "g1dap/session/inbox.hpp"

using namespace g1dap;

TEST_CASE("g1dap inbox preserves FIFO order across message types") {
  session::inbox inbox;

  dap::request request;
  request.seq = 1;
  request.command = "threads";
  engine::engine_event event;
  event.kind = engine::event_kind::running;

  inbox.push(request);
  inbox.push(event);
  CHECK(inbox.size() == 2);

  session::session_message out;
  REQUIRE(inbox.poll(out));
  REQUIRE(std::holds_alternative<dap::request>(out));
  CHECK(std::get<dap::request>(out).command == "threads");
  REQUIRE(inbox.poll(out));
  REQUIRE(std::holds_alternative<engine::engine_event>(out));
  CHECK(std::get<engine::engine_event>(out).kind == engine::event_kind::running);
  CHECK_FALSE(inbox.poll(out));
}

TEST_CASE("g1dap inbox wait drains before reporting close") {
  session::inbox inbox;
  engine::engine_event event;
  event.kind = engine::event_kind::paused;
  inbox.push(event);
  inbox.close();
  inbox.push(event);

  session::session_message out;
  CHECK(inbox.wait(out));
  CHECK_FALSE(inbox.wait(out));
}

TEST_CASE("g1dap inbox wait wakes for a message from another thread") {
  session::inbox inbox;
  std::thread producer([&inbox]() {
    engine::engine_event event;
    event.kind = engine::event_kind::output;
    event.text = "hello";
    inbox.push(event);
  });

  session::session_message out;
  REQUIRE(inbox.wait(out));
  producer.join();
  CHECK(std::get<engine::engine_event>(out).text == "hello");
}
