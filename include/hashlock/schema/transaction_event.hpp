#pragma once

#include <cstdint>
#include <hashlock/schema/transaction_event_attribute.hpp>
#include <string>
#include <utility>
#include <vector>

// Schema type: transaction event.
// Escrow workflow: emitted by programs on state transitions
// (escrow_initialized, claim_requested, escrow_released, ...).
namespace hashlock::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

inline transaction_event_t make_event(
    std::string type,
    std::vector<transaction_event_attribute_t> attributes) {
  return transaction_event_t{.type = std::move(type),
                             .attributes = std::move(attributes)};
}

}  // namespace hashlock::schema
