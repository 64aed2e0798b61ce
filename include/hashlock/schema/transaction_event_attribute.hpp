#pragma once

#include <cstdint>
#include <string>

namespace hashlock::schema {

template <uint16_t Version>
struct transaction_event_attribute;

template <>
struct transaction_event_attribute<1> final {
  std::string key;
  std::string value;
  bool index{};
};

using transaction_event_attribute_t = transaction_event_attribute<1>;

}  // namespace hashlock::schema
