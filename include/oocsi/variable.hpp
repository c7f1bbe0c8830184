#pragma once

#include <cmath>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

#include "client.hpp"

namespace oocsi {

/// A single value shared through one key on one channel.
///
/// Arithmetic values can be clamped with min()/max() and smoothed over a
/// moving window with smooth(); with a sigma, a jump away from the window
/// mean is limited to sigma divided by the window fill.
template <typename T> class variable {
public:
  variable(client &owner, std::string channel, std::string key)
      : client_(owner), channel_(std::move(channel)),
        state_(std::make_shared<state>()) {
    state_->key = std::move(key);
    auto shared = state_;
    client_.subscribe(channel_, [shared](const std::string &, const std::string &,
                                         const json &data) {
      auto it = data.find(shared->key);
      if (it == data.end())
        return;
      try {
        shared->accept(it->template get<T>());
      } catch (const json::exception &e) {
        spdlog::debug("variable {}: ignored value: {}", shared->key, e.what());
      }
    });
  }

  /// Current value, or the window mean when smoothing. Pumps the client
  /// once first so that pending updates are seen.
  std::optional<T> get() {
    client_.pump();
    return state_->current();
  }

  /// Store a value locally (after constraints) and publish it.
  void set(const T &value) {
    state_->accept(value);
    (void)client_.publish(channel_, json{{state_->key, *state_->last_accepted}});
  }

  variable &min(const T &value) {
    static_assert(std::is_arithmetic<T>::value, "min() needs an arithmetic type");
    state_->min = value;
    if (state_->value && *state_->value < value)
      state_->value = value;
    return *this;
  }

  variable &max(const T &value) {
    static_assert(std::is_arithmetic<T>::value, "max() needs an arithmetic type");
    state_->max = value;
    if (state_->value && *state_->value > value)
      state_->value = value;
    return *this;
  }

  variable &smooth(size_t window, std::optional<double> sigma = std::nullopt) {
    static_assert(std::is_arithmetic<T>::value,
                  "smooth() needs an arithmetic type");
    state_->window = window;
    state_->sigma = sigma;
    while (state_->values.size() > window)
      state_->values.pop_front();
    return *this;
  }

  const std::string &channel() const { return channel_; }
  const std::string &key() const { return state_->key; }

private:
  struct state {
    std::string key;
    std::optional<T> value;
    std::optional<T> last_accepted;
    std::deque<T> values;
    size_t window = 0;
    std::optional<T> min;
    std::optional<T> max;
    std::optional<double> sigma;

    std::optional<T> current() const {
      if constexpr (std::is_arithmetic<T>::value) {
        if (window > 0 && !values.empty()) {
          double sum = 0;
          for (const auto &v : values)
            sum += static_cast<double>(v);
          double mean = sum / static_cast<double>(values.size());
          // integral means round to nearest
          if constexpr (std::is_integral<T>::value)
            return static_cast<T>(std::llround(mean));
          return static_cast<T>(mean);
        }
      }
      return value;
    }

    void accept(T incoming) {
      if constexpr (std::is_arithmetic<T>::value)
        incoming = constrain(incoming);
      last_accepted = incoming;
      if (window > 0) {
        values.push_back(incoming);
        while (values.size() > window)
          values.pop_front();
        return;
      }
      value = std::move(incoming);
    }

    T constrain(T v) const {
      if (min && v < *min)
        return *min;
      if (max && v > *max)
        return *max;
      if (sigma && window > 0 && !values.empty()) {
        auto mean = current();
        double m = static_cast<double>(*mean);
        double d = static_cast<double>(v);
        if (std::abs(m - d) > *sigma) {
          double step = *sigma / static_cast<double>(values.size());
          return static_cast<T>(m - d > 0 ? m - step : m + step);
        }
      }
      return v;
    }
  };

  client &client_;
  std::string channel_;
  std::shared_ptr<state> state_;
};

} // namespace oocsi
