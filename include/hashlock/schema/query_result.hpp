#pragma once

#include <cstdint>
#include <hashlock/schema/primitives.hpp>
#include <string>

// Schema type: query result.
// Ledger workflow: read API envelope carrying the SCALE encoded answer, the
// echoed key, and the committed slot it was read at.
namespace hashlock::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t key;
  bytes_t value;
  slot_t slot{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace hashlock::schema
