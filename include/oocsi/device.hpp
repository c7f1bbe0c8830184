#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

#include "client.hpp"

namespace oocsi {

/// Channel that collects device descriptions.
constexpr const char *kHeyOOCSIChannel = "heyOOCSI!";

constexpr std::array<const char *, 6> kLedTypes = {"RGB",   "RGBW",     "RGBWW",
                                                   "CCT",   "DIMMABLE", "ONOFF"};
constexpr std::array<const char *, 3> kSpectrums = {"WHITE", "CCT", "RGB"};

/// Builds a heyOOCSI! description of this device, its components and
/// locations, and publishes it with submit().
class device {
public:
  device(client &owner, std::string name)
      : client_(owner), name_(std::move(name)) {
    doc_[name_] = {{"properties", {{"device_id", client_.handle()}}},
                   {"components", json::object()},
                   {"location", json::object()}};
    spdlog::info("[{}]: Created device {}.", client_.handle(), name_);
  }

  device &add_property(const std::string &property, json value) {
    body()["properties"][property] = std::move(value);
    spdlog::info("[{}]: Added {} to the properties list of device {}.",
                 client_.handle(), property, name_);
    return *this;
  }

  device &add_location(const std::string &location, double latitude = 0,
                       double longitude = 0) {
    body()["location"][location] = json::array({latitude, longitude});
    spdlog::info("[{}]: Added {} to the locations list of device {}.",
                 client_.handle(), location, name_);
    return *this;
  }

  device &add_sensor(const std::string &sensor, const std::string &channel,
                     const std::string &sensor_type, const std::string &unit,
                     double default_value, const std::string &mode = "auto",
                     std::optional<double> step = std::nullopt,
                     std::optional<std::string> icon = std::nullopt) {
    json c = {{"channel_name", channel},
              {"type", "sensor"},
              {"sensor_type", sensor_type},
              {"unit", unit},
              {"value", default_value},
              {"mode", mode},
              {"step", or_null(step)},
              {"icon", or_null(icon)}};
    return add_component(sensor, std::move(c));
  }

  device &add_number(const std::string &number, const std::string &channel,
                     std::pair<double, double> min_max, const std::string &unit,
                     double default_value,
                     std::optional<std::string> icon = std::nullopt) {
    json c = {{"channel_name", channel},
              {"min_max", json::array({min_max.first, min_max.second})},
              {"type", "number"},
              {"unit", unit},
              {"value", default_value},
              {"icon", or_null(icon)}};
    return add_component(number, std::move(c));
  }

  device &add_binary_sensor(const std::string &sensor, const std::string &channel,
                            const std::string &sensor_type,
                            bool default_state = false,
                            std::optional<std::string> icon = std::nullopt) {
    json c = {{"channel_name", channel},
              {"type", "binary_sensor"},
              {"sensor_type", sensor_type},
              {"state", default_state},
              {"icon", or_null(icon)}};
    return add_component(sensor, std::move(c));
  }

  device &add_switch(const std::string &name, const std::string &channel,
                     bool default_state = false,
                     std::optional<std::string> icon = std::nullopt) {
    json c = {{"channel_name", channel},
              {"type", "switch"},
              {"state", default_state},
              {"icon", or_null(icon)}};
    return add_component(name, std::move(c));
  }

  /// Unknown led types and spectrums are reported but still recorded.
  device &add_light(const std::string &light, const std::string &channel,
                    const std::string &led_type, const std::string &spectrum,
                    bool default_state = false, int default_brightness = 0,
                    std::optional<std::pair<int, int>> mired_min_max = std::nullopt,
                    std::optional<std::string> icon = std::nullopt) {
    if (!known(kLedTypes, led_type)) {
      spdlog::error("[{}]: error, {} ledtype does not exist.", client_.handle(),
                    light);
    } else if (!known(kSpectrums, spectrum)) {
      spdlog::error("[{}]: error, {} spectrum does not exist.", client_.handle(),
                    light);
    }

    json c = {{"channel_name", channel},
              {"type", "light"},
              {"ledType", led_type},
              {"spectrum", spectrum},
              {"min_max", mired_min_max
                              ? json::array({mired_min_max->first,
                                             mired_min_max->second})
                              : json(nullptr)},
              {"state", default_state},
              {"brightness", default_brightness},
              {"icon", or_null(icon)}};
    return add_component(light, std::move(c));
  }

  /// Publish the description. Returns false when it could not be sent.
  bool submit() {
    bool sent = client_.publish(kHeyOOCSIChannel, doc_);
    if (sent) {
      spdlog::info("[{}]: Sent heyOOCSI! message for device {}.",
                   client_.handle(), name_);
    }
    return sent;
  }

  bool say_hi() { return submit(); }

  const std::string &name() const { return name_; }
  const json &description() const { return doc_; }

private:
  template <typename V> static json or_null(const std::optional<V> &v) {
    return v ? json(*v) : json(nullptr);
  }

  template <size_t N>
  static bool known(const std::array<const char *, N> &names,
                    const std::string &value) {
    return std::any_of(names.begin(), names.end(),
                       [&](const char *n) { return value == n; });
  }

  json &body() { return doc_[name_]; }

  device &add_component(const std::string &component, json doc) {
    body()["components"][component] = std::move(doc);
    spdlog::info("[{}]: Added {} to the components list of device {}.",
                 client_.handle(), component, name_);
    return *this;
  }

  client &client_;
  std::string name_;
  json doc_ = json::object();
};

inline device client::hey_oocsi(const std::string &name) {
  return device(*this, name.empty() ? handle_ : name);
}

} // namespace oocsi
