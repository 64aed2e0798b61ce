#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <hashlock/schema/primitives.hpp>
#include <string>
#include <string_view>
#include <system_error>

namespace hashlock::testing {

inline hashlock::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = hashlock::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Wallet-style address. Only the leading byte varies, so distinct seeds give
/// distinct addresses.
inline hashlock::schema::address_t make_address(const uint8_t seed) {
  auto address = hashlock::schema::address_t{};
  address.fill(0x11);
  address[0] = seed;
  return address;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace hashlock::testing
