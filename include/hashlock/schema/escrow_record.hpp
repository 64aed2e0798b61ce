#pragma once

#include <cstddef>
#include <hashlock/schema/primitives.hpp>
#include <optional>

// Schema type: escrow record.
// Escrow workflow: persisted state of one hash-locked escrow. Lives in the
// data of the program-derived account keyed by `seed`.
namespace hashlock::schema {

inline constexpr std::size_t kEscrowSeedLength = 32;
inline constexpr std::size_t kCommittedDigestLength = 64;

template <uint16_t Version>
struct escrow_record;

template <>
struct escrow_record<1> final {
  std::array<uint8_t, kEscrowSeedLength> seed{};
  lamports_t amount{};
  std::array<uint8_t, kCommittedDigestLength> committed_digest{};
  bool is_claimed{};
  std::optional<address_t> receiver;
  address_t initializer{};

  bool operator==(const escrow_record<1>&) const = default;
};

using escrow_record_t = escrow_record<1>;

}  // namespace hashlock::schema
