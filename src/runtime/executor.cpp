#include <spdlog/spdlog.h>
#include <algorithm>
#include <boost/multiprecision/cpp_int.hpp>
#include <hashlock/common/critical.hpp>
#include <hashlock/runtime/executor.hpp>
#include <iterator>
#include <utility>

using namespace hashlock::schema;

namespace hashlock::runtime {

namespace {

using wide_sum_t = boost::multiprecision::uint128_t;

// Rules for one account changed by `program_id` while it held `writable`.
program_error check_account_change(const account_t& pre,
                                   const account_t& post,
                                   const address_t& program_id,
                                   const bool writable) {
  auto changed = pre.lamports != post.lamports || pre.data != post.data ||
                 pre.owner != post.owner || pre.executable != post.executable;
  if (!changed) {
    return program_error::success;
  }
  if (!writable) {
    return program_error::account_not_writable;
  }
  if (pre.executable != post.executable) {
    return program_error::illegal_owner;
  }
  if (pre.owner != post.owner) {
    auto zeroed = std::ranges::all_of(
        pre.data, [](const uint8_t byte) { return byte == 0; });
    if (pre.owner != program_id || !zeroed) {
      return program_error::illegal_owner;
    }
  }
  if (pre.data != post.data && pre.owner != program_id) {
    return program_error::illegal_owner;
  }
  if (post.lamports < pre.lamports && pre.owner != program_id) {
    return program_error::illegal_owner;
  }
  return program_error::success;
}

}  // namespace

executor::executor(const program_registry_t& programs,
                   account_set_t& accounts,
                   const slot_t slot,
                   rent rent_schedule)
    : programs_{programs},
      accounts_{accounts},
      slot_{slot},
      rent_{std::move(rent_schedule)} {}

program_error executor::execute(const instruction_t& instruction,
                                const std::vector<address_t>& signers) {
  auto infos = std::vector<account_info>{};
  infos.reserve(instruction.accounts.size());
  for (const auto& meta : instruction.accounts) {
    auto signed_by_tx = std::ranges::find(signers, meta.address) !=
                        std::end(signers);
    if (meta.is_signer && !signed_by_tx) {
      spdlog::warn("Instruction account {} requires a missing signature",
                   to_hex(meta.address));
      return program_error::missing_signature;
    }
    infos.push_back(account_info{.key = meta.address,
                                 .is_signer = meta.is_signer,
                                 .is_writable = meta.is_writable,
                                 .account = &accounts_[meta.address]});
  }

  auto result = run(instruction.program_id, infos,
                    bytes_view_t{instruction.data.data(),
                                 instruction.data.size()});
  if (result == program_error::success && failed_invocation_.has_value()) {
    return *failed_invocation_;
  }
  return result;
}

slot_t executor::slot() const {
  return slot_;
}

const rent& executor::rent_schedule() const {
  return rent_;
}

program_error executor::invoke_signed(const instruction_t& instruction,
                                      account_infos_t accounts,
                                      const signer_seeds_t& signer_seeds) {
  if (frames_.empty()) {
    hashlock::common::critical("invoke_signed called outside of a program");
  }
  const auto caller_id = frames_.back().program_id;

  auto fail = [&](const program_error error) {
    if (!failed_invocation_.has_value()) {
      failed_invocation_ = error;
    }
    return error;
  };

  auto pda_signers = std::vector<address_t>{};
  pda_signers.reserve(signer_seeds.size());
  for (const auto& seeds : signer_seeds) {
    auto derived = hashlock::address::create_program_address(seeds, caller_id);
    if (!derived) {
      return fail(program_error::invalid_seeds);
    }
    pda_signers.push_back(*derived);
  }

  if (!find_account(accounts, instruction.program_id)) {
    spdlog::warn("Invoked program {} is not among the caller's accounts",
                 to_hex(instruction.program_id));
    return fail(program_error::not_enough_account_keys);
  }

  auto infos = std::vector<account_info>{};
  infos.reserve(instruction.accounts.size());
  for (const auto& meta : instruction.accounts) {
    auto caller_view = find_account(accounts, meta.address);
    if (!caller_view) {
      return fail(program_error::not_enough_account_keys);
    }
    auto may_sign =
        caller_view->is_signer ||
        std::ranges::find(pda_signers, meta.address) != std::end(pda_signers);
    if (meta.is_signer && !may_sign) {
      spdlog::warn("Signer privilege escalated for {}", to_hex(meta.address));
      return fail(program_error::privilege_escalation);
    }
    if (meta.is_writable && !caller_view->is_writable) {
      spdlog::warn("Writable privilege escalated for {}",
                   to_hex(meta.address));
      return fail(program_error::privilege_escalation);
    }
    infos.push_back(account_info{.key = meta.address,
                                 .is_signer = meta.is_signer,
                                 .is_writable = meta.is_writable,
                                 .account = caller_view->account});
  }

  auto at_entry = account_set_t{};
  for (const auto& info : infos) {
    at_entry.try_emplace(info.key, *info.account);
  }

  auto result = run(instruction.program_id, infos,
                    bytes_view_t{instruction.data.data(),
                                 instruction.data.size()});
  if (result != program_error::success) {
    return fail(result);
  }

  // The callee's changes are legitimate from the caller's point of view;
  // carry them into the caller's baseline without hiding its own changes.
  auto& caller = frames_.back();
  for (const auto& [key, entry] : at_entry) {
    auto& baseline = caller.pre[key];
    const auto& now = accounts_.at(key);
    if (now.lamports >= entry.lamports) {
      baseline.lamports += now.lamports - entry.lamports;
    } else {
      baseline.lamports -= entry.lamports - now.lamports;
    }
    if (now.data != entry.data) {
      baseline.data = now.data;
    }
    if (now.owner != entry.owner) {
      baseline.owner = now.owner;
    }
  }
  return program_error::success;
}

void executor::emit(transaction_event_t event) {
  events_.push_back(std::move(event));
}

std::vector<transaction_event_t>& executor::events() {
  return events_;
}

program_error executor::run(const address_t& program_id,
                            std::vector<account_info>& accounts,
                            const bytes_view_t& data) {
  if (frames_.size() >= kMaxInvokeDepth) {
    return program_error::call_depth_exceeded;
  }
  auto found = programs_.find(program_id);
  if (found == std::end(programs_) || !found->second) {
    spdlog::warn("No program registered at {}", to_hex(program_id));
    return program_error::unknown_program;
  }

  auto current = frame{.program_id = program_id, .pre = {}};
  for (const auto& info : accounts) {
    current.pre.try_emplace(info.key, *info.account);
  }
  frames_.push_back(std::move(current));

  auto result = found->second->process_instruction(
      program_id, account_infos_t{accounts.data(), accounts.size()}, data,
      *this);
  auto finished = std::move(frames_.back());
  frames_.pop_back();

  if (result != program_error::success) {
    return result;
  }
  return verify(finished, accounts);
}

program_error executor::verify(const frame& current,
                               const std::vector<account_info>& accounts) const {
  auto pre_total = wide_sum_t{0};
  auto post_total = wide_sum_t{0};
  for (const auto& [key, pre] : current.pre) {
    const auto& post = accounts_.at(key);
    // Writable if any handle for the key was writable.
    auto writable = std::ranges::any_of(accounts, [&](const account_info& info) {
      return info.key == key && info.is_writable;
    });
    auto error = check_account_change(pre, post, current.program_id, writable);
    if (error != program_error::success) {
      spdlog::warn("Program {} broke account rules for {}: {}",
                   to_hex(current.program_id), to_hex(key), to_string(error));
      return error;
    }
    pre_total += pre.lamports;
    post_total += post.lamports;
  }
  if (pre_total != post_total) {
    spdlog::warn("Program {} did not conserve lamports",
                 to_hex(current.program_id));
    return program_error::unbalanced_instruction;
  }
  return program_error::success;
}

}  // namespace hashlock::runtime
