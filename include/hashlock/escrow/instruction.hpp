#pragma once

#include <array>
#include <cstdint>
#include <hashlock/address/program_address.hpp>
#include <hashlock/escrow/constants.hpp>
#include <hashlock/schema/instruction.hpp>
#include <hashlock/schema/primitives.hpp>
#include <optional>
#include <string_view>

// Escrow instruction payloads and client-side instruction builders.
//
// Every instruction is a one byte opcode followed by its payload. Integers are
// little endian.
namespace hashlock::escrow {

enum class opcode : uint8_t {
  initialize = 0,
  claim = 1,
  verify_and_release = 2,
};

using execution_id_t = std::array<uint8_t, kExecutionIdLength>;

/// seed_len:u8, seed, hash_len:u8, hash, amount:u64
struct initialize_args final {
  hashlock::schema::bytes_t seed;
  std::array<uint8_t, kDigestTextLength> committed_digest{};
  hashlock::schema::lamports_t amount{};
};

/// execution_id:[u8;16], bump:u8, tip:u64, expiry_offset:u64, seed_len:u8,
/// seed, preimage_len:u16, preimage
struct claim_args final {
  execution_id_t execution_id{};
  uint8_t bump{};
  hashlock::schema::lamports_t tip{};
  uint64_t expiry_offset{};
  hashlock::schema::bytes_t seed;
  hashlock::schema::bytes_t preimage;
};

/// Zero-pads `id` to the fixed execution id width. std::nullopt when `id` is
/// longer than kExecutionIdLength bytes.
std::optional<execution_id_t> make_execution_id(std::string_view id);

/// Parse the payload after the opcode. std::nullopt on truncation or when a
/// field is out of range.
std::optional<initialize_args> parse_initialize(
    const hashlock::schema::bytes_view_t& payload);
std::optional<claim_args> parse_claim(
    const hashlock::schema::bytes_view_t& payload);

/// Opcode plus payload. Lengths are written as given, unchecked.
hashlock::schema::bytes_t encode_initialize(const initialize_args& args);
hashlock::schema::bytes_t encode_claim(const claim_args& args);

std::optional<hashlock::address::derived_address> escrow_address(
    const hashlock::schema::address_t& escrow_program,
    const hashlock::schema::bytes_view_t& seed);

std::optional<hashlock::address::derived_address> tracker_address(
    const hashlock::schema::address_t& escrow_program,
    const hashlock::schema::bytes_view_t& execution_id);

hashlock::schema::instruction_t make_initialize_instruction(
    const hashlock::schema::address_t& escrow_program,
    const hashlock::schema::address_t& initializer,
    const initialize_args& args);

/// Derives every claim account and sets `args.bump` to the tracker bump.
hashlock::schema::instruction_t make_claim_instruction(
    const hashlock::schema::address_t& escrow_program,
    const hashlock::schema::address_t& oracle_program,
    const hashlock::schema::address_t& payer,
    const hashlock::schema::address_t& receiver,
    claim_args args);

}  // namespace hashlock::escrow
