#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <random>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "event.hpp"
#include "framer.hpp"
#include "identity.hpp"
#include "registry.hpp"
#include "transport.hpp"

namespace oocsi {

class device;

enum class connection_state { disconnected, connecting, connected };

inline const char *to_string(connection_state state) {
  switch (state) {
  case connection_state::disconnected:
    return "disconnected";
  case connection_state::connecting:
    return "connecting";
  case connection_state::connected:
    return "connected";
  }
  return "unknown";
}

struct client_options {
  int connect_timeout_ms = 10000;
  size_t read_chunk_size = 1024;
  size_t max_line_length = 65536;
  int write_timeout_ms = 1000;
  /// Retry the handshake from pump() after the connection drops.
  bool auto_reconnect = false;
  int reconnect_delay_ms = 2000;
};

constexpr int kDefaultCallTimeoutMs = 1000;

/// Client for an OOCSI broker.
///
/// One instance owns one broker connection and is driven by exactly one
/// thread: either call pump() from a polling loop, or pump_for() / hand
/// native_handle() to an event loop and call pump() when it is readable.
/// Subscriptions, pending calls and responders live on the instance and
/// must not be touched concurrently with pump().
class client {
public:
  /// Dial host:port and run the handshake. Blocks until connected or until
  /// the handshake failed; failures leave the client disconnected.
  client(const std::string &host, int port = kDefaultPort,
         const std::string &handle = std::string(kDefaultHandle),
         event_fn default_receiver = nullptr, client_options options = {})
      : options_(options), framer_(options.max_line_length), host_(host),
        port_(port), dialable_(true) {
    init(handle, std::move(default_receiver));
    spdlog::info("[{}]: connecting to {} port {}", handle_, host_, port_);
    open();
  }

  /// Run the handshake over a transport the host already opened.
  explicit client(connection conn,
                  const std::string &handle = std::string(kDefaultHandle),
                  event_fn default_receiver = nullptr,
                  client_options options = {})
      : options_(options), framer_(options.max_line_length),
        conn_(std::move(conn)), dialable_(false) {
    init(handle, std::move(default_receiver));
    open();
  }

  ~client() {
    if (is_open(conn_))
      stop();
  }

  client(const client &) = delete;
  client &operator=(const client &) = delete;

  const std::string &handle() const { return handle_; }
  connection_state state() const { return state_; }
  bool is_connected() const { return state_ == connection_state::connected; }
  bool reconnect_enabled() const { return reconnect_; }
  int native_handle() const { return conn_.fd; }

  /// Send data to a channel. Returns false when the write failed; the
  /// client is then disconnected.
  bool publish(const std::string &channel, const json &data) {
    if (channel.empty()) {
      throw std::invalid_argument("channel is required");
    }
    return send_line("sendraw " + channel + " " +
                     data.dump(-1, ' ', false, json::error_handler_t::replace));
  }

  /// Add a receiver to a channel. Receivers run in subscription order;
  /// adding the same receiver twice makes it run twice per event.
  void subscribe(const std::string &channel,
                 std::shared_ptr<event_receiver> receiver) {
    if (channel.empty()) {
      throw std::invalid_argument("channel is required");
    }
    subscriptions_.add(channel, std::move(receiver));
    (void)send_line("subscribe " + channel);
    spdlog::info("[{}]: subscribed to {}", handle_, channel);
  }

  void subscribe(const std::string &channel, event_fn fn) {
    subscribe(channel, make_receiver(std::move(fn)));
  }

  /// Drop every receiver of a channel. Throws std::out_of_range when the
  /// channel was never subscribed.
  void unsubscribe(const std::string &channel) {
    subscriptions_.remove(channel);
    (void)send_line("unsubscribe " + channel);
    spdlog::info("[{}]: unsubscribed from {}", handle_, channel);
  }

  /// Answer calls named `name` that arrive on `channel`.
  void register_responder(const std::string &channel, const std::string &name,
                          responder_fn responder) {
    if (channel.empty() || name.empty()) {
      throw std::invalid_argument("channel and call name are required");
    }
    services_.add(channel, name, std::move(responder));
    (void)send_line("subscribe " + channel);
    spdlog::info("[{}]: registered responder on {} for {}", handle_, channel,
                 name);
  }

  /// Issue a call and return at once. The returned record is fulfilled by a
  /// later pump() if the response arrives before the deadline.
  std::shared_ptr<pending_call> call(const std::string &channel,
                                     const std::string &name,
                                     json data = json::object(),
                                     int timeout_ms = kDefaultCallTimeoutMs) {
    if (channel.empty() || name.empty()) {
      throw std::invalid_argument("channel and call name are required");
    }
    if (!data.is_object())
      data = json::object();

    auto id = make_call_id(rng_);
    auto pending =
        calls_.issue(id, name, std::chrono::milliseconds(timeout_ms));
    data[kMessageHandle] = name;
    data[kMessageId] = id;
    (void)publish(channel, data);
    return pending;
  }

  /// Issue a call and pump until it is answered or times out. The result
  /// may still lack a response; check has_response().
  std::shared_ptr<pending_call>
  call_and_wait(const std::string &channel, const std::string &name,
                json data = json::object(),
                int timeout_ms = kDefaultCallTimeoutMs) {
    auto pending = call(channel, name, std::move(data), timeout_ms);
    while (is_connected() && pending->state() == call_state::pending) {
      auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
          pending->deadline() - steady_clock::now());
      if (remaining.count() <= 0)
        break;
      pump_for(static_cast<int>(remaining.count()));
    }
    return pending;
  }

  /// One receive-and-dispatch cycle. Never blocks once connected. Exceptions
  /// thrown by receivers or responders propagate; lines not yet dispatched
  /// stay buffered for the next call.
  void pump() {
    if (!is_open(conn_)) {
      maybe_reconnect();
      calls_.prune();
      return;
    }

    auto result = conn_read(conn_, chunk_.data(), chunk_.size());
    switch (result.status) {
    case read_status::closed:
      spdlog::warn("[{}]: connection closed by server", handle_);
      mark_disconnected();
      return;
    case read_status::error:
      spdlog::error("[{}]: recv() failed: {}", handle_,
                    errno_text(result.error));
      mark_disconnected();
      return;
    case read_status::would_block:
      break;
    case read_status::data:
      framer_.push(chunk_.data(), result.bytes);
      break;
    }

    std::string line;
    while (is_connected() && framer_.next_line(line)) {
      handle_line(line);
    }
    calls_.prune();
  }

  /// True when a pump() would find something to do within timeout_ms.
  bool wait_readable(int timeout_ms) {
    if (framer_.has_line())
      return true;
    if (!is_open(conn_))
      return false;
    return oocsi::wait_readable(conn_, timeout_ms);
  }

  /// Wait up to timeout_ms for input, then run one pump().
  void pump_for(int timeout_ms) {
    if (is_open(conn_)) {
      (void)wait_readable(timeout_ms);
    } else if (options_.auto_reconnect && reconnect_ && dialable_) {
      auto until_retry = std::chrono::ceil<std::chrono::milliseconds>(
          next_reconnect_ - steady_clock::now());
      auto wait = std::min<long long>(until_retry.count(), timeout_ms);
      if (wait > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(wait));
    }
    pump();
  }

  /// Dial again and redo the handshake, replaying subscriptions. Only for
  /// clients that dialed themselves and were not stopped or rejected.
  bool reconnect() {
    if (!dialable_ || !reconnect_) {
      spdlog::warn("[{}]: reconnect not possible", handle_);
      return false;
    }
    close_transport();
    spdlog::info("[{}]: reconnecting to {} port {}", handle_, host_, port_);
    open();
    return is_connected();
  }

  /// Say goodbye and close. The client stays disconnected afterwards.
  void stop() {
    reconnect_ = false;
    if (is_open(conn_) && !write_all(conn_, "quit\n", options_.write_timeout_ms)) {
      spdlog::debug("[{}]: quit not delivered", handle_);
    }
    close_transport();
    state_ = connection_state::disconnected;
    spdlog::info("[{}]: stopped", handle_);
  }

  /// Start a device description published on the heyOOCSI! channel.
  /// Defined in device.hpp, which this header pulls in.
  device hey_oocsi(const std::string &name = "");

  const subscription_registry &subscriptions() const { return subscriptions_; }
  const call_registry &calls() const { return calls_; }
  const service_registry &services() const { return services_; }

private:
  void init(const std::string &handle_template, event_fn default_receiver) {
    handle_ = resolve_handle(handle_template, rng_);
    chunk_.resize(options_.read_chunk_size > 0 ? options_.read_chunk_size : 1024);
    // the own handle is always a channel, replayed like any other
    subscriptions_.ensure(handle_);
    if (default_receiver)
      subscriptions_.add(handle_, make_receiver(std::move(default_receiver)));
  }

  void open() {
    state_ = connection_state::connecting;
    try {
      if (!is_open(conn_)) {
        if (!dialable_) {
          throw std::runtime_error("no transport to connect over");
        }
        conn_ = dial_tcp(host_, port_, options_.connect_timeout_ms);
      }
      handshake();
    } catch (const std::exception &e) {
      spdlog::error("[{}]: connection failed: {}", handle_, e.what());
      close_transport();
      state_ = connection_state::disconnected;
    }
    if (!is_connected())
      next_reconnect_ =
          steady_clock::now() + std::chrono::milliseconds(options_.reconnect_delay_ms);
  }

  void handshake() {
    framer_.reset();
    if (!write_all(conn_, handle_ + "(JSON)\n", options_.write_timeout_ms)) {
      throw std::runtime_error("handshake send failed: " + errno_text(errno));
    }

    auto deadline =
        steady_clock::now() + std::chrono::milliseconds(options_.connect_timeout_ms);
    std::string reply;
    while (!framer_.next_line(reply)) {
      auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
          deadline - steady_clock::now());
      if (remaining.count() <= 0) {
        throw std::runtime_error("handshake timeout");
      }
      if (!oocsi::wait_readable(conn_, static_cast<int>(remaining.count())))
        continue;

      auto result = conn_read(conn_, chunk_.data(), chunk_.size());
      if (result.status == read_status::closed) {
        throw std::runtime_error("connection closed during handshake");
      }
      if (result.status == read_status::error) {
        throw std::runtime_error("recv() failed: " + errno_text(result.error));
      }
      if (result.status == read_status::data)
        framer_.push(chunk_.data(), result.bytes);
    }

    if (reply.rfind("{", 0) == 0) {
      spdlog::info("[{}]: connection established", handle_);
      replay_subscriptions();
      if (!is_open(conn_))
        return;
      state_ = connection_state::connected;
      set_nonblocking(conn_);
      return;
    }

    if (reply.rfind("error", 0) == 0) {
      spdlog::warn("[{}]: {}", handle_, reply);
      reconnect_ = false;
    } else {
      spdlog::warn("[{}]: unexpected handshake reply: {}", handle_, reply);
    }
    close_transport();
    state_ = connection_state::disconnected;
  }

  void replay_subscriptions() {
    auto channels = subscriptions_.channels();
    for (const auto &channel : services_.channels()) {
      if (!subscriptions_.contains(channel))
        channels.push_back(channel);
    }
    for (const auto &channel : channels) {
      if (!send_line("subscribe " + channel))
        return;
    }
  }

  bool send_line(const std::string &text) {
    if (!is_open(conn_)) {
      spdlog::warn("[{}]: not connected, dropped: {}", handle_, text);
      return false;
    }
    if (!write_all(conn_, text + "\n", options_.write_timeout_ms)) {
      spdlog::error("[{}]: send failed: {}", handle_, errno_text(errno));
      mark_disconnected();
      return false;
    }
    return true;
  }

  void handle_line(const std::string &line) {
    switch (classify_line(line)) {
    case line_kind::keep_alive:
      (void)send_line(".");
      return;
    case line_kind::ignored:
      if (!line.empty())
        spdlog::debug("[{}]: ignored line: {}", handle_, line);
      return;
    case line_kind::event:
      break;
    }

    json msg;
    try {
      msg = json::parse(line);
    } catch (const json::parse_error &e) {
      spdlog::debug("[{}]: discarded malformed event: {}", handle_, e.what());
      return;
    }
    dispatch(std::move(msg));
  }

  void dispatch(json msg) {
    auto ev = decode_event(std::move(msg));
    if (!ev) {
      spdlog::debug("[{}]: discarded event without sender/recipient", handle_);
      return;
    }

    json &data = ev->data;
    auto call_name = data.find(kMessageHandle);
    if (call_name != data.end()) {
      responder_fn responder;
      if (call_name->is_string())
        responder = services_.find(call_name->get<std::string>());
      if (responder) {
        data.erase(kMessageHandle);
        respond(*ev, responder);
        return;
      }
    }

    auto id = data.find(kMessageId);
    if (id != data.end()) {
      std::string call_id = id->is_string() ? id->get<std::string>() : id->dump();
      switch (calls_.complete(call_id, std::move(data))) {
      case completion::fulfilled:
        break;
      case completion::expired:
        spdlog::debug("[{}]: late response for call {} dropped", handle_, call_id);
        break;
      case completion::unknown:
        spdlog::debug("[{}]: response for unknown call {}", handle_, call_id);
        break;
      }
      return;
    }

    deliver(ev->sender, ev->recipient, data);
  }

  void respond(const event &ev, const responder_fn &responder) {
    json request = ev.data;
    json id;
    auto it = request.find(kMessageId);
    if (it != request.end()) {
      id = *it;
      request.erase(it);
    }

    json reply = responder(request);
    if (!reply.is_object())
      reply = json::object();
    if (!id.is_null())
      reply[kMessageId] = id;

    (void)publish(ev.sender, reply);
    deliver(ev.sender, ev.recipient, request);
  }

  void deliver(const std::string &sender, const std::string &recipient,
               const json &data) {
    for (const auto &receiver : subscriptions_.receivers(recipient)) {
      receiver->receive(sender, recipient, data);
    }
  }

  void maybe_reconnect() {
    if (!options_.auto_reconnect || !reconnect_ || !dialable_)
      return;
    if (steady_clock::now() < next_reconnect_)
      return;
    spdlog::info("[{}]: reconnecting to {} port {}", handle_, host_, port_);
    open();
  }

  void mark_disconnected() {
    close_transport();
    state_ = connection_state::disconnected;
    next_reconnect_ =
        steady_clock::now() + std::chrono::milliseconds(options_.reconnect_delay_ms);
  }

  void close_transport() {
    close_connection(conn_);
    framer_.reset();
  }

  client_options options_;
  line_framer framer_;
  std::vector<char> chunk_;
  connection conn_;

  std::string host_;
  int port_ = kDefaultPort;
  bool dialable_ = false;
  bool reconnect_ = true;
  steady_clock::time_point next_reconnect_{};

  std::string handle_;
  connection_state state_ = connection_state::disconnected;
  std::mt19937 rng_{std::random_device{}()};

  subscription_registry subscriptions_;
  call_registry calls_;
  service_registry services_;
};

} // namespace oocsi

#include "device.hpp"
