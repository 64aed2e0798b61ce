#pragma once

#include <hashlock/schema/primitives.hpp>

namespace hashlock::schema {

template <uint16_t Version>
struct account_meta;

template <>
struct account_meta<1> final {
  address_t address{};
  bool is_signer{};
  bool is_writable{};

  bool operator==(const account_meta<1>&) const = default;
};

using account_meta_t = account_meta<1>;

inline account_meta_t make_writable_meta(const address_t& address,
                                         const bool is_signer = false) {
  return account_meta_t{
      .address = address, .is_signer = is_signer, .is_writable = true};
}

inline account_meta_t make_readonly_meta(const address_t& address,
                                         const bool is_signer = false) {
  return account_meta_t{
      .address = address, .is_signer = is_signer, .is_writable = false};
}

}  // namespace hashlock::schema
