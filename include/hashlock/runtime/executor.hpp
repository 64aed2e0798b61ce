#pragma once

#include <cstddef>
#include <hashlock/runtime/invoke_context.hpp>
#include <hashlock/runtime/program.hpp>
#include <hashlock/schema/account.hpp>
#include <hashlock/schema/instruction.hpp>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace hashlock::runtime {

using program_registry_t =
    std::map<hashlock::schema::address_t, std::shared_ptr<program>>;
using account_set_t =
    std::map<hashlock::schema::address_t, hashlock::schema::account_t>;

inline constexpr std::size_t kMaxInvokeDepth = 4;

/// Runs one top-level instruction, and every invocation it makes, against a
/// private working set of accounts.
///
/// The caller owns `accounts` and decides whether to keep or discard it once
/// `execute` returns. After every program returns, ownership and lamport
/// conservation rules are checked against the accounts it was given.
class executor final : public invoke_context {
 public:
  executor(const program_registry_t& programs,
           account_set_t& accounts,
           hashlock::schema::slot_t slot,
           rent rent_schedule = rent{});

  /// Instruction accounts absent from the working set start empty and owned
  /// by the system program. A meta marked signer must appear in `signers`.
  hashlock::schema::program_error execute(
      const hashlock::schema::instruction_t& instruction,
      const std::vector<hashlock::schema::address_t>& signers);

  hashlock::schema::slot_t slot() const override;
  const rent& rent_schedule() const override;

  hashlock::schema::program_error invoke_signed(
      const hashlock::schema::instruction_t& instruction,
      account_infos_t accounts,
      const signer_seeds_t& signer_seeds) override;

  void emit(hashlock::schema::transaction_event_t event) override;

  std::vector<hashlock::schema::transaction_event_t>& events();

 private:
  struct frame final {
    hashlock::schema::address_t program_id{};
    account_set_t pre;
  };

  hashlock::schema::program_error run(
      const hashlock::schema::address_t& program_id,
      std::vector<account_info>& accounts,
      const hashlock::schema::bytes_view_t& data);

  hashlock::schema::program_error verify(
      const frame& current,
      const std::vector<account_info>& accounts) const;

  const program_registry_t& programs_;
  account_set_t& accounts_;
  hashlock::schema::slot_t slot_{};
  rent rent_;
  std::vector<frame> frames_;
  std::vector<hashlock::schema::transaction_event_t> events_;
  std::optional<hashlock::schema::program_error> failed_invocation_;
};

}  // namespace hashlock::runtime
