#pragma once

#include <hashlock/escrow/constants.hpp>
#include <hashlock/runtime/program.hpp>
#include <string>
#include <string_view>

namespace hashlock::escrow {

/// Hash-preimage escrow.
///
/// Value is locked against the hex text of a SHA-256 digest and released to
/// whoever gets the oracle to attest a matching digest for their preimage:
///
///   initialize          lock (or top up) value under `seed`
///   claim               ask the oracle to hash a preimage, with a callback
///   verify_and_release  oracle callback; pays out on a digest match
///
/// The program never hashes anything itself. It only trusts callbacks signed
/// by the oracle execution account recorded for the claim.
class program final : public hashlock::runtime::program {
 public:
  explicit program(const hashlock::schema::address_t& oracle_program,
                   std::string_view image_id = kSha256ImageId);

  hashlock::schema::program_error process_instruction(
      const hashlock::schema::address_t& program_id,
      hashlock::runtime::account_infos_t accounts,
      const hashlock::schema::bytes_view_t& data,
      hashlock::runtime::invoke_context& context) override;

 private:
  hashlock::schema::program_error initialize(
      const hashlock::schema::address_t& program_id,
      hashlock::runtime::account_infos_t accounts,
      const hashlock::schema::bytes_view_t& payload,
      hashlock::runtime::invoke_context& context);

  hashlock::schema::program_error claim(
      const hashlock::schema::address_t& program_id,
      hashlock::runtime::account_infos_t accounts,
      const hashlock::schema::bytes_view_t& payload,
      hashlock::runtime::invoke_context& context);

  hashlock::schema::program_error verify_and_release(
      const hashlock::schema::address_t& program_id,
      hashlock::runtime::account_infos_t accounts,
      const hashlock::schema::bytes_view_t& payload,
      hashlock::runtime::invoke_context& context);

  hashlock::schema::address_t oracle_program_;
  std::string image_id_;
};

}  // namespace hashlock::escrow
