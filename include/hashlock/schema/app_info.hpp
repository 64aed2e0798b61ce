#pragma once

#include <cstdint>
#include <hashlock/schema/primitives.hpp>
#include <string>

namespace hashlock::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  std::string data{"hashlock-escrow"};
  std::string version{"0.1.0"};
  slot_t last_committed_slot{};
  hash32_t last_state_root{};
};

using app_info_t = app_info<1>;

}  // namespace hashlock::schema
