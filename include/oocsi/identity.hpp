#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

#include "transport.hpp"

namespace oocsi {

inline bool is_blank(std::string_view text) {
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      return false;
  }
  return true;
}

/// Resolve a handle template: each '#' becomes one random decimal digit.
/// A blank template falls back to kDefaultHandle.
template <typename Rng>
std::string resolve_handle(std::string_view handle_template, Rng &rng) {
  std::string handle = is_blank(handle_template)
                           ? std::string(kDefaultHandle)
                           : std::string(handle_template);
  std::uniform_int_distribution<int> digit(0, 9);
  for (auto &c : handle) {
    if (c == '#')
      c = static_cast<char>('0' + digit(rng));
  }
  return handle;
}

/// Random RFC 4122 version 4 identifier, e.g.
/// "3f2b8c1e-9d4a-4e7b-a1c0-5f6e7d8c9b0a".
template <typename Rng> std::string make_call_id(Rng &rng) {
  std::uniform_int_distribution<int> byte(0, 255);
  std::array<uint8_t, 16> bytes{};
  for (auto &b : bytes)
    b = static_cast<uint8_t>(byte(rng));
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

  static constexpr char kHex[] = "0123456789abcdef";
  std::string id;
  id.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10)
      id.push_back('-');
    id.push_back(kHex[bytes[i] >> 4]);
    id.push_back(kHex[bytes[i] & 0x0F]);
  }
  return id;
}

} // namespace oocsi
