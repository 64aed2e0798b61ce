#pragma once

#include <cstdint>
#include <hashlock/schema/primitives.hpp>

namespace hashlock::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  slot_t committed_slot{};
  hash32_t state_root{};
  uint64_t accounts_written{};
};

using commit_result_t = commit_result<1>;

}  // namespace hashlock::schema
