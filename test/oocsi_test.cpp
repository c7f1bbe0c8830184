#include "../include/oocsi/oocsi.hpp"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <random>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<std::string> drain(oocsi::line_framer &framer) {
  std::vector<std::string> lines;
  std::string line;
  while (framer.next_line(line))
    lines.push_back(line);
  return lines;
}

struct recorder : oocsi::event_receiver {
  std::vector<std::string> seen;
  void receive(const std::string &sender, const std::string &recipient,
               const oocsi::json &data) override {
    seen.push_back(sender + ">" + recipient + ":" + data.dump());
  }
};

} // namespace

int main() {
  int passed = 0;

  // --- scheme / parse_uri ---
  assert(oocsi::scheme("tcp://oocsi.example.net:4444") == "tcp");
  ++passed;
  assert(oocsi::kDefaultURI == "tcp://localhost:4444");
  ++passed;
  {
    auto parsed = oocsi::parse_uri("tcp://oocsi.example.net:5555");
    assert(parsed.scheme == "tcp");
    ++passed;
    assert(parsed.host == "oocsi.example.net");
    ++passed;
    assert(parsed.port == 5555);
    ++passed;
  }
  {
    auto parsed = oocsi::parse_uri("tcp://broker");
    assert(parsed.host == "broker");
    ++passed;
    assert(parsed.port == 4444);
    ++passed;
  }
  {
    auto parsed = oocsi::parse_uri("tcp://:7000");
    assert(parsed.host == "localhost");
    ++passed;
    assert(parsed.port == 7000);
    ++passed;
  }
  try {
    (void)oocsi::parse_uri("ws://broker:80");
    assert(false && "should have thrown");
  } catch (const std::invalid_argument &) {
    ++passed;
  }
  try {
    (void)oocsi::parse_uri("tcp://broker:notaport");
    assert(false && "should have thrown");
  } catch (const std::invalid_argument &) {
    ++passed;
  }
  try {
    (void)oocsi::parse_uri("tcp://broker:70000");
    assert(false && "should have thrown");
  } catch (const std::invalid_argument &) {
    ++passed;
  }

  // --- parse_flags ---
  {
    auto cfg = oocsi::parse_flags({});
    assert(cfg.uri == "tcp://localhost:4444");
    ++passed;
    assert(cfg.handle == "OOCSIClient_####");
    ++passed;
  }
  {
    auto cfg = oocsi::parse_flags({"--host", "broker", "--handle", "lamp_#"});
    assert(cfg.uri == "tcp://broker:4444");
    ++passed;
    assert(cfg.handle == "lamp_#");
    ++passed;
  }
  {
    auto cfg = oocsi::parse_flags({"--uri", "tcp://a:1", "--port", "9"});
    assert(cfg.uri == "tcp://a:9");
    ++passed;
  }
  {
    // a bad --uri only surfaces once the endpoint is parsed
    bool rejected = false;
    try {
      auto cfg = oocsi::parse_flags({"--uri", "udp://a:1"});
      (void)oocsi::parse_uri(cfg.uri);
    } catch (const std::invalid_argument &) {
      rejected = true;
    }
    assert(rejected);
    ++passed;
  }

  // --- classify_line ---
  assert(oocsi::classify_line("ping") == oocsi::line_kind::keep_alive);
  ++passed;
  assert(oocsi::classify_line(".") == oocsi::line_kind::keep_alive);
  ++passed;
  assert(oocsi::classify_line("{\"a\":1}") == oocsi::line_kind::event);
  ++passed;
  assert(oocsi::classify_line("") == oocsi::line_kind::ignored);
  ++passed;
  assert(oocsi::classify_line("welcome") == oocsi::line_kind::ignored);
  ++passed;

  // --- line_framer ---
  {
    oocsi::line_framer framer;
    framer.push("ping\n{\"a\":1}\n");
    auto lines = drain(framer);
    assert(lines.size() == 2);
    ++passed;
    assert(lines[0] == "ping");
    ++passed;
    assert(lines[1] == "{\"a\":1}");
    ++passed;
    assert(framer.pending() == 0);
    ++passed;
  }
  {
    // a line split across two reads comes out whole
    oocsi::line_framer framer;
    framer.push("{\"sender\":\"s\",");
    assert(drain(framer).empty());
    ++passed;
    assert(!framer.has_line());
    ++passed;
    framer.push("\"recipient\":\"c\"}\r\n.");
    auto lines = drain(framer);
    assert(lines.size() == 1);
    ++passed;
    assert(lines[0] == "{\"sender\":\"s\",\"recipient\":\"c\"}");
    ++passed;
    assert(framer.pending() == 1);
    ++passed;
    framer.push("\n");
    lines = drain(framer);
    assert(lines.size() == 1 && lines[0] == ".");
    ++passed;
  }
  {
    // lines are handed out one at a time
    oocsi::line_framer framer;
    framer.push("a\nb\nc\n");
    std::string line;
    assert(framer.next_line(line) && line == "a");
    ++passed;
    assert(framer.has_line());
    ++passed;
    auto rest = drain(framer);
    assert(rest.size() == 2 && rest[0] == "b" && rest[1] == "c");
    ++passed;
  }
  {
    // an oversized partial line is dropped up to the next newline
    oocsi::line_framer framer(8);
    framer.push("ok\n0123456789");
    framer.push("abcdef\nnext\n");
    auto lines = drain(framer);
    assert(lines.size() == 2);
    ++passed;
    assert(lines[0] == "ok");
    ++passed;
    assert(lines[1] == "next");
    ++passed;
  }
  {
    oocsi::line_framer framer;
    framer.push("partial");
    framer.reset();
    framer.push("line\n");
    auto lines = drain(framer);
    assert(lines.size() == 1 && lines[0] == "line");
    ++passed;
  }

  // --- resolve_handle ---
  {
    std::mt19937 rng(42);
    auto handle = oocsi::resolve_handle("Dev_##", rng);
    assert(std::regex_match(handle, std::regex("Dev_\\d\\d")));
    ++passed;
    assert(oocsi::resolve_handle("plain", rng) == "plain");
    ++passed;
    auto fallback = oocsi::resolve_handle("   ", rng);
    assert(std::regex_match(fallback, std::regex("OOCSIClient_\\d{4}")));
    ++passed;
    auto empty = oocsi::resolve_handle("", rng);
    assert(empty.rfind("OOCSIClient_", 0) == 0 && empty.find('#') == std::string::npos);
    ++passed;
  }

  // --- make_call_id ---
  {
    std::mt19937 rng(7);
    std::regex layout(
        "[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
    std::set<std::string> ids;
    for (int i = 0; i < 64; ++i) {
      auto id = oocsi::make_call_id(rng);
      assert(std::regex_match(id, layout));
      ids.insert(id);
    }
    ++passed;
    assert(ids.size() == 64);
    ++passed;
  }

  // --- decode_event ---
  {
    auto ev = oocsi::decode_event(oocsi::json::parse(
        R"({"sender":"s","recipient":"ch","timestamp":1700000000000,"data":{},"x":1})"));
    assert(ev.has_value());
    ++passed;
    assert(ev->sender == "s" && ev->recipient == "ch");
    ++passed;
    assert(ev->timestamp == 1700000000000LL);
    ++passed;
    assert(ev->data == oocsi::json({{"x", 1}}));
    ++passed;
  }
  {
    auto ev = oocsi::decode_event(
        oocsi::json::parse(R"({"sender":"s","recipient":"ch","y":"z"})"));
    assert(ev.has_value() && ev->timestamp == 0);
    ++passed;
    assert(!oocsi::decode_event(oocsi::json::parse(R"({"recipient":"ch"})")));
    ++passed;
    assert(!oocsi::decode_event(oocsi::json::parse(R"({"sender":1,"recipient":"ch"})")));
    ++passed;
    assert(!oocsi::decode_event(oocsi::json::parse("[1,2]")));
    ++passed;
  }
  {
    auto ev = oocsi::decode_event(oocsi::json::parse(
        R"({"sender":"s","recipient":"ch","timestamp":0,"_MESSAGE_ID":"i","_MESSAGE_HANDLE":"h"})"));
    assert(ev && ev->data.contains(oocsi::kMessageId));
    ++passed;
    assert(ev->data.contains(oocsi::kMessageHandle));
    ++passed;
  }

  // --- subscription_registry ---
  {
    oocsi::subscription_registry subs;
    auto a = std::make_shared<recorder>();
    auto b = std::make_shared<recorder>();
    subs.add("ch", a);
    subs.add("ch", b);
    subs.add("ch", a);
    subs.add("other", b);
    auto receivers = subs.receivers("ch");
    assert(receivers.size() == 3);
    ++passed;
    assert(receivers[0] == a && receivers[1] == b && receivers[2] == a);
    ++passed;
    assert(subs.channels() == std::vector<std::string>({"ch", "other"}));
    ++passed;

    subs.ensure("own");
    assert(subs.contains("own") && subs.receivers("own").empty());
    ++passed;

    subs.remove("ch");
    assert(!subs.contains("ch") && subs.receivers("ch").empty());
    ++passed;
    try {
      subs.remove("ch");
      assert(false && "should have thrown");
    } catch (const std::out_of_range &e) {
      assert(std::string(e.what()).find("ch") != std::string::npos);
      ++passed;
    }
  }

  // --- call_registry ---
  {
    using namespace std::chrono;
    oocsi::call_registry calls;
    auto t0 = oocsi::steady_clock::now();
    auto call = calls.issue("id-1", "add", milliseconds(100), t0);
    assert(call->state(t0) == oocsi::call_state::pending);
    ++passed;
    assert(calls.contains("id-1") && calls.size() == 1);
    ++passed;

    auto outcome = calls.complete(
        "id-1", {{"sum", 3}, {oocsi::kMessageId, "id-1"}}, t0 + milliseconds(99));
    assert(outcome == oocsi::completion::fulfilled);
    ++passed;
    assert(call->has_response() && call->response() == oocsi::json({{"sum", 3}}));
    ++passed;
    assert(call->state(t0 + seconds(10)) == oocsi::call_state::fulfilled);
    ++passed;
    assert(calls.size() == 0);
    ++passed;
    assert(calls.complete("id-1", oocsi::json::object(), t0) ==
           oocsi::completion::unknown);
    ++passed;
  }
  {
    using namespace std::chrono;
    oocsi::call_registry calls;
    auto t0 = oocsi::steady_clock::now();
    auto call = calls.issue("id-2", "add", milliseconds(100), t0);
    // exactly at the deadline is already too late
    auto outcome = calls.complete("id-2", {{"sum", 3}}, t0 + milliseconds(100));
    assert(outcome == oocsi::completion::expired);
    ++passed;
    assert(!call->has_response());
    ++passed;
    assert(call->state(t0 + milliseconds(100)) == oocsi::call_state::expired);
    ++passed;
    assert(!calls.contains("id-2"));
    ++passed;
    try {
      (void)call->response();
      assert(false && "should have thrown");
    } catch (const std::logic_error &) {
      ++passed;
    }
  }
  {
    using namespace std::chrono;
    oocsi::call_registry calls;
    auto t0 = oocsi::steady_clock::now();
    calls.issue("short", "a", milliseconds(10), t0);
    calls.issue("long", "b", milliseconds(1000), t0);
    assert(calls.prune(t0 + milliseconds(50)) == 1);
    ++passed;
    assert(!calls.contains("short") && calls.contains("long"));
    ++passed;
  }

  // --- service_registry ---
  {
    oocsi::service_registry services;
    services.add("svc", "add", [](const oocsi::json &) {
      return oocsi::json{{"v", 1}};
    });
    services.add("svc", "sub", [](const oocsi::json &) { return oocsi::json{}; });
    services.add("other", "add", [](const oocsi::json &) {
      return oocsi::json{{"v", 2}};
    });
    assert(services.size() == 2);
    ++passed;
    auto add = services.find("add");
    assert(add && add(oocsi::json::object())["v"] == 2);
    ++passed;
    assert(!services.find("missing"));
    ++passed;
    auto channels = services.channels();
    assert(channels.size() == 2);
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
