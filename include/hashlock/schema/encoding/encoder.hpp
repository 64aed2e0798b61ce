#pragma once
#include <hashlock/schema/primitives.hpp>
#include <optional>
#include <span>

namespace hashlock::schema::encoding {

// Encoders are selected at build time by tag. SCALE is used for ledger
// envelopes and persisted runtime rows; the layout encoder produces the
// fixed-width record images stored inside program-owned account data.
template <typename Library>
struct encoder {
  template <typename T>
  hashlock::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, hashlock::schema::bytes_t& out);

  template <typename T>
  T decode(const hashlock::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const hashlock::schema::bytes_view_t& bytes);
};

}  // namespace hashlock::schema::encoding
