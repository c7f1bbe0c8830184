#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

namespace oocsi {

using json = nlohmann::json;

/// Control field naming the service a call is addressed to.
constexpr const char *kMessageHandle = "_MESSAGE_HANDLE";
/// Control field correlating a call with its response.
constexpr const char *kMessageId = "_MESSAGE_ID";

/// An inbound channel event with the envelope split off the payload.
struct event {
  std::string sender;
  std::string recipient;
  int64_t timestamp = 0;
  json data = json::object();
};

/// Split a decoded broker message into envelope and payload. Returns nothing
/// when the message is not an object or lacks a string sender/recipient.
inline std::optional<event> decode_event(json msg) {
  if (!msg.is_object())
    return std::nullopt;

  auto sender = msg.find("sender");
  auto recipient = msg.find("recipient");
  if (sender == msg.end() || !sender->is_string() || recipient == msg.end() ||
      !recipient->is_string()) {
    return std::nullopt;
  }

  event ev;
  ev.sender = sender->get<std::string>();
  ev.recipient = recipient->get<std::string>();
  auto ts = msg.find("timestamp");
  if (ts != msg.end() && ts->is_number())
    ev.timestamp = ts->get<int64_t>();

  msg.erase("sender");
  msg.erase("recipient");
  msg.erase("timestamp");
  msg.erase("data");
  ev.data = std::move(msg);
  return ev;
}

/// Something that wants channel events.
class event_receiver {
public:
  virtual ~event_receiver() = default;
  virtual void receive(const std::string &sender, const std::string &recipient,
                       const json &data) = 0;
};

using event_fn = std::function<void(const std::string &sender,
                                    const std::string &recipient,
                                    const json &data)>;

/// Adapts a plain callable to event_receiver.
class function_receiver : public event_receiver {
public:
  explicit function_receiver(event_fn fn) : fn_(std::move(fn)) {}

  void receive(const std::string &sender, const std::string &recipient,
               const json &data) override {
    if (fn_)
      fn_(sender, recipient, data);
  }

private:
  event_fn fn_;
};

inline std::shared_ptr<event_receiver> make_receiver(event_fn fn) {
  return std::make_shared<function_receiver>(std::move(fn));
}

} // namespace oocsi
