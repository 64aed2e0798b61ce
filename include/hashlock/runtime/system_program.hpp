#pragma once

#include <cstdint>
#include <hashlock/runtime/program.hpp>
#include <hashlock/schema/instruction.hpp>

// Native account creation and value transfer.
namespace hashlock::runtime::system {

/// The system program lives at the all-zero address and owns every account
/// that has not been assigned to another program.
inline constexpr auto kProgramId = hashlock::schema::address_t{};

enum class opcode : uint8_t {
  create_account = 0,
  transfer = 1,
};

/// Accounts: [from (signer, writable), to (signer, writable)].
hashlock::schema::instruction_t make_create_account_instruction(
    const hashlock::schema::address_t& from,
    const hashlock::schema::address_t& to,
    hashlock::schema::lamports_t lamports,
    uint64_t space,
    const hashlock::schema::address_t& owner);

/// Accounts: [from (signer, writable), to (writable)].
hashlock::schema::instruction_t make_transfer_instruction(
    const hashlock::schema::address_t& from,
    const hashlock::schema::address_t& to,
    hashlock::schema::lamports_t lamports);

class program final : public hashlock::runtime::program {
 public:
  hashlock::schema::program_error process_instruction(
      const hashlock::schema::address_t& program_id,
      account_infos_t accounts,
      const hashlock::schema::bytes_view_t& data,
      invoke_context& context) override;
};

}  // namespace hashlock::runtime::system
