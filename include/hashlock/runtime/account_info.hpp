#pragma once

#include <algorithm>
#include <hashlock/schema/account.hpp>
#include <hashlock/schema/primitives.hpp>
#include <optional>
#include <span>

namespace hashlock::runtime {

/// Handle a program receives for one instruction account.
///
/// `account` points into the transaction's working set; several handles for
/// the same key share one account.
struct account_info final {
  hashlock::schema::address_t key{};
  bool is_signer{};
  bool is_writable{};
  hashlock::schema::account_t* account{};

  hashlock::schema::lamports_t lamports() const { return account->lamports; }
  hashlock::schema::bytes_t& data() const { return account->data; }
  const hashlock::schema::address_t& owner() const { return account->owner; }

  /// An account "holds value" once it carries lamports or data.
  bool holds_value() const {
    return account->lamports > 0 || !account->data.empty();
  }
};

using account_infos_t = std::span<account_info>;

inline std::optional<account_info> find_account(
    const account_infos_t& accounts,
    const hashlock::schema::address_t& key) {
  auto found = std::ranges::find_if(
      accounts, [&](const account_info& info) { return info.key == key; });
  if (found == std::end(accounts)) {
    return std::nullopt;
  }
  return *found;
}

}  // namespace hashlock::runtime
