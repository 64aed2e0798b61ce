#pragma once

#include <hashlock/address/program_address.hpp>
#include <hashlock/runtime/account_info.hpp>
#include <hashlock/runtime/rent.hpp>
#include <hashlock/schema/instruction.hpp>
#include <hashlock/schema/program_error.hpp>
#include <hashlock/schema/transaction_event.hpp>
#include <vector>

namespace hashlock::runtime {

using signer_seeds_t = std::vector<hashlock::address::seeds_t>;

/// Services the runtime offers to the program currently executing.
class invoke_context {
 public:
  virtual ~invoke_context() = default;

  virtual hashlock::schema::slot_t slot() const = 0;
  virtual const rent& rent_schedule() const = 0;

  /// Cross-program invocation. Each entry of `signer_seeds` grants signer
  /// privilege to the address it derives under the calling program.
  virtual hashlock::schema::program_error invoke_signed(
      const hashlock::schema::instruction_t& instruction,
      account_infos_t accounts,
      const signer_seeds_t& signer_seeds) = 0;

  hashlock::schema::program_error invoke(
      const hashlock::schema::instruction_t& instruction,
      account_infos_t accounts) {
    return invoke_signed(instruction, accounts, {});
  }

  virtual void emit(hashlock::schema::transaction_event_t event) = 0;
};

}  // namespace hashlock::runtime
