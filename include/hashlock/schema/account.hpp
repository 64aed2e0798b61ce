#pragma once

#include <cstdint>
#include <hashlock/schema/primitives.hpp>

// Schema type: ledger account.
// Runtime workflow: balance, opaque program data, owning program and the
// executable marker for one address.
namespace hashlock::schema {

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  uint16_t version{1};
  lamports_t lamports{};
  bytes_t data;
  address_t owner{};
  bool executable{};

  bool operator==(const account<1>&) const = default;
};

using account_t = account<1>;

}  // namespace hashlock::schema
