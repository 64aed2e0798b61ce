#pragma once

#include <cstdint>
#include <hashlock/schema/primitives.hpp>
#include <hashlock/schema/transaction_event.hpp>
#include <string>
#include <vector>

namespace hashlock::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace hashlock::schema
