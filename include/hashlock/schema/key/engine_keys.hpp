#pragma once

#include <hashlock/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Ledger workflow: canonical key prefixes and key codecs for persisted
// accounts and the committed checkpoint.
namespace hashlock::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kCommittedSlotKey{"SYS|APP|COMMITTED_SLOT"};

template <typename Encoder, typename T>
hashlock::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are concatenated field bytes, so this equals the
  // encoding of tuple{prefix, id}.
  auto key = encoder.encode(std::string{prefix});
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
hashlock::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(std::string{prefix});
}

template <typename Encoder>
hashlock::schema::bytes_t make_account_key(
    Encoder& encoder,
    const hashlock::schema::address_t& address) {
  return make_prefixed_key(encoder, kAccountKeyPrefix, address);
}

template <typename Encoder>
std::optional<hashlock::schema::address_t> parse_account_key(
    Encoder& encoder,
    const hashlock::schema::bytes_view_t& key) {
  auto decoded = encoder.template try_decode<
      std::tuple<std::string, hashlock::schema::address_t>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kAccountKeyPrefix) {
    return std::nullopt;
  }
  return std::get<1>(decoded.value());
}

}  // namespace hashlock::schema::key
