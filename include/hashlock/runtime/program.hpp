#pragma once

#include <hashlock/runtime/account_info.hpp>
#include <hashlock/schema/primitives.hpp>
#include <hashlock/schema/program_error.hpp>

namespace hashlock::runtime {

class invoke_context;

/// An on-ledger program. Implementations must be deterministic: the same
/// accounts, data and context must always yield the same result.
class program {
 public:
  virtual ~program() = default;

  virtual hashlock::schema::program_error process_instruction(
      const hashlock::schema::address_t& program_id,
      account_infos_t accounts,
      const hashlock::schema::bytes_view_t& data,
      invoke_context& context) = 0;
};

}  // namespace hashlock::runtime
