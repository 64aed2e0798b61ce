#include <spdlog/spdlog.h>
#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <hashlock/runtime/invoke_context.hpp>
#include <hashlock/runtime/system_program.hpp>
#include <iterator>

using namespace hashlock::schema;

namespace hashlock::runtime::system {

namespace {

inline constexpr auto kCreateAccountDataSize = std::size_t{1 + 8 + 8 + 32};
inline constexpr auto kTransferDataSize = std::size_t{1 + 8};
// Keeps a single allocation bounded.
inline constexpr auto kMaxAccountSpace = uint64_t{10 * 1024 * 1024};

void append_u64(bytes_t& out, const uint64_t value) {
  auto offset = out.size();
  out.resize(offset + sizeof(uint64_t));
  boost::endian::store_little_u64(out.data() + offset, value);
}

program_error create_account(account_infos_t accounts,
                             const bytes_view_t& data) {
  if (data.size() != kCreateAccountDataSize) {
    return program_error::invalid_instruction_data;
  }
  if (accounts.size() < 2) {
    return program_error::not_enough_account_keys;
  }
  auto lamports = boost::endian::load_little_u64(data.data() + 1);
  auto space = boost::endian::load_little_u64(data.data() + 9);
  auto owner = address_t{};
  std::copy_n(data.data() + 17, owner.size(), std::begin(owner));

  auto& from = accounts[0];
  auto& to = accounts[1];
  if (!from.is_signer || !to.is_signer) {
    return program_error::missing_signature;
  }
  if (!from.is_writable || !to.is_writable) {
    return program_error::account_not_writable;
  }
  if (to.holds_value() || to.owner() != kProgramId) {
    spdlog::warn("create_account: address {} already in use",
                 to_hex(to.key));
    return program_error::account_already_in_use;
  }
  if (space > kMaxAccountSpace) {
    return program_error::invalid_input;
  }
  if (from.lamports() < lamports) {
    return program_error::insufficient_funds;
  }

  from.account->lamports -= lamports;
  to.account->lamports += lamports;
  to.account->data.assign(static_cast<std::size_t>(space), 0);
  to.account->owner = owner;
  spdlog::debug("create_account: {} funded with {} lamports, {} bytes",
                to_hex(to.key), lamports, space);
  return program_error::success;
}

program_error transfer(account_infos_t accounts, const bytes_view_t& data) {
  if (data.size() != kTransferDataSize) {
    return program_error::invalid_instruction_data;
  }
  if (accounts.size() < 2) {
    return program_error::not_enough_account_keys;
  }
  auto lamports = boost::endian::load_little_u64(data.data() + 1);
  auto& from = accounts[0];
  auto& to = accounts[1];
  if (!from.is_signer) {
    return program_error::missing_signature;
  }
  if (!from.is_writable || !to.is_writable) {
    return program_error::account_not_writable;
  }
  if (!from.data().empty()) {
    return program_error::invalid_input;
  }
  if (from.lamports() < lamports) {
    return program_error::insufficient_funds;
  }
  if (from.key != to.key) {
    from.account->lamports -= lamports;
    to.account->lamports += lamports;
  }
  return program_error::success;
}

}  // namespace

instruction_t make_create_account_instruction(const address_t& from,
                                              const address_t& to,
                                              const lamports_t lamports,
                                              const uint64_t space,
                                              const address_t& owner) {
  auto data = bytes_t{static_cast<uint8_t>(opcode::create_account)};
  append_u64(data, lamports);
  append_u64(data, space);
  data.insert(std::end(data), std::begin(owner), std::end(owner));
  return instruction_t{.program_id = kProgramId,
                       .accounts = {make_writable_meta(from, true),
                                    make_writable_meta(to, true)},
                       .data = std::move(data)};
}

instruction_t make_transfer_instruction(const address_t& from,
                                        const address_t& to,
                                        const lamports_t lamports) {
  auto data = bytes_t{static_cast<uint8_t>(opcode::transfer)};
  append_u64(data, lamports);
  return instruction_t{
      .program_id = kProgramId,
      .accounts = {make_writable_meta(from, true), make_writable_meta(to)},
      .data = std::move(data)};
}

program_error program::process_instruction(const address_t&,
                                           account_infos_t accounts,
                                           const bytes_view_t& data,
                                           invoke_context&) {
  if (data.empty()) {
    return program_error::invalid_instruction_data;
  }
  switch (static_cast<opcode>(data[0])) {
    case opcode::create_account:
      return create_account(accounts, data);
    case opcode::transfer:
      return transfer(accounts, data);
  }
  return program_error::invalid_instruction_data;
}

}  // namespace hashlock::runtime::system
