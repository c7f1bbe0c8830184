#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "event.hpp"

namespace oocsi {

using steady_clock = std::chrono::steady_clock;

/// Channel name -> receivers, in subscription order. The same receiver may
/// appear more than once on a channel; it is then invoked once per entry.
class subscription_registry {
public:
  void add(const std::string &channel, std::shared_ptr<event_receiver> receiver) {
    auto it = find(channel);
    if (it == entries_.end()) {
      entries_.push_back({channel, {}});
      it = std::prev(entries_.end());
    }
    if (receiver)
      it->receivers.push_back(std::move(receiver));
  }

  /// Make sure a channel is present even without receivers, so it is
  /// replayed on connect.
  void ensure(const std::string &channel) { add(channel, nullptr); }

  void remove(const std::string &channel) {
    auto it = find(channel);
    if (it == entries_.end())
      throw std::out_of_range("not subscribed to channel: " + channel);
    entries_.erase(it);
  }

  bool contains(const std::string &channel) const {
    return find(channel) != entries_.end();
  }

  /// Receivers of a channel, copied so that callbacks may (un)subscribe
  /// while being dispatched.
  std::vector<std::shared_ptr<event_receiver>>
  receivers(const std::string &channel) const {
    auto it = find(channel);
    if (it == entries_.end())
      return {};
    return it->receivers;
  }

  std::vector<std::string> channels() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto &e : entries_)
      out.push_back(e.channel);
    return out;
  }

  size_t size() const { return entries_.size(); }

private:
  struct entry {
    std::string channel;
    std::vector<std::shared_ptr<event_receiver>> receivers;
  };

  std::vector<entry>::iterator find(const std::string &channel) {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&](const entry &e) { return e.channel == channel; });
  }
  std::vector<entry>::const_iterator find(const std::string &channel) const {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&](const entry &e) { return e.channel == channel; });
  }

  std::vector<entry> entries_;
};

enum class call_state { pending, fulfilled, expired };

/// A call issued by this client, observable by the caller until it is
/// answered or its deadline passes.
class pending_call {
public:
  pending_call(std::string id, std::string name, steady_clock::time_point deadline)
      : id_(std::move(id)), name_(std::move(name)), deadline_(deadline) {}

  const std::string &id() const { return id_; }
  const std::string &name() const { return name_; }
  steady_clock::time_point deadline() const { return deadline_; }

  bool has_response() const { return response_.has_value(); }

  /// The response payload. Throws std::logic_error when there is none yet.
  const json &response() const {
    if (!response_)
      throw std::logic_error("call " + id_ + " has no response");
    return *response_;
  }

  call_state state(steady_clock::time_point now = steady_clock::now()) const {
    if (response_)
      return call_state::fulfilled;
    return now >= deadline_ ? call_state::expired : call_state::pending;
  }

private:
  friend class call_registry;

  std::string id_;
  std::string name_;
  steady_clock::time_point deadline_;
  std::optional<json> response_;
};

enum class completion { fulfilled, expired, unknown };

/// Call id -> outstanding call. Records leave the registry once answered or
/// found expired; callers keep their own shared_ptr to read the outcome.
class call_registry {
public:
  std::shared_ptr<pending_call> issue(std::string id, std::string name,
                                      std::chrono::milliseconds timeout,
                                      steady_clock::time_point now = steady_clock::now()) {
    auto call = std::make_shared<pending_call>(id, std::move(name), now + timeout);
    pending_[std::move(id)] = call;
    return call;
  }

  /// Attach a response. A response at or after the deadline is dropped.
  completion complete(const std::string &id, json payload,
                      steady_clock::time_point now = steady_clock::now()) {
    auto it = pending_.find(id);
    if (it == pending_.end())
      return completion::unknown;

    auto call = it->second;
    pending_.erase(it);
    if (now >= call->deadline_)
      return completion::expired;

    payload.erase(kMessageId);
    call->response_ = std::move(payload);
    return completion::fulfilled;
  }

  /// Drop every record whose deadline has passed. Returns how many went.
  size_t prune(steady_clock::time_point now = steady_clock::now()) {
    size_t removed = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (now >= it->second->deadline_) {
        it = pending_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  bool contains(const std::string &id) const { return pending_.count(id) != 0; }
  size_t size() const { return pending_.size(); }

private:
  std::unordered_map<std::string, std::shared_ptr<pending_call>> pending_;
};

using responder_fn = std::function<json(const json &)>;

/// Call name -> responder. Registering a name again replaces its responder.
class service_registry {
public:
  void add(const std::string &channel, const std::string &name,
           responder_fn responder) {
    services_[name] = service{channel, std::move(responder)};
  }

  bool contains(const std::string &name) const {
    return services_.count(name) != 0;
  }

  /// Responder for a call name, or an empty function.
  responder_fn find(const std::string &name) const {
    auto it = services_.find(name);
    return it == services_.end() ? responder_fn{} : it->second.responder;
  }

  /// Channels responders listen on, without duplicates.
  std::vector<std::string> channels() const {
    std::vector<std::string> out;
    for (const auto &kv : services_) {
      if (std::find(out.begin(), out.end(), kv.second.channel) == out.end())
        out.push_back(kv.second.channel);
    }
    return out;
  }

  size_t size() const { return services_.size(); }

private:
  struct service {
    std::string channel;
    responder_fn responder;
  };

  std::unordered_map<std::string, service> services_;
};

} // namespace oocsi
