#pragma once

#include <cstddef>
#include <cstdint>
#include <hashlock/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

// Program-derived addresses.
//
// A program-derived address is SHA-256(seeds || program_id || marker) for a
// digest that is NOT a valid compressed Ed25519 point, so no private key can
// ever sign for it. Only the deriving program may authorise it, by presenting
// the seeds to the runtime.
namespace hashlock::address {

inline constexpr std::size_t kMaxSeedLength = 32;
inline constexpr std::size_t kMaxSeeds = 16;
inline constexpr std::string_view kProgramDerivedMarker{
    "ProgramDerivedAddress"};

using seeds_t = std::vector<hashlock::schema::bytes_view_t>;

struct derived_address final {
  hashlock::schema::address_t address{};
  uint8_t bump{};
};

/// True when `point` decompresses to a point on edwards25519.
bool is_on_curve(const hashlock::schema::hash32_t& point);

/// Hash `seeds` (bump included by the caller) under `program_id`.
///
/// Returns std::nullopt when the seed set is malformed or the digest lands on
/// the curve.
std::optional<hashlock::schema::address_t> create_program_address(
    const seeds_t& seeds,
    const hashlock::schema::address_t& program_id);

/// Search bump 255..0 for the first off-curve address.
std::optional<derived_address> find_program_address(
    const seeds_t& seeds,
    const hashlock::schema::address_t& program_id);

}  // namespace hashlock::address
