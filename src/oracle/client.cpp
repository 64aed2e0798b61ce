#include <hashlock/crypto/sha256.hpp>
#include <hashlock/oracle/client.hpp>
#include <hashlock/runtime/system_program.hpp>
#include <hashlock/schema/encoding/scale/encoder.hpp>
#include <iterator>

using namespace hashlock::schema;

namespace hashlock::oracle {

std::optional<hashlock::address::derived_address> execution_address(
    const address_t& oracle_program,
    const address_t& requester,
    const bytes_view_t& execution_id) {
  return hashlock::address::find_program_address(
      {make_bytes_view(kExecutionSeed),
       bytes_view_t{requester.data(), requester.size()}, execution_id},
      oracle_program);
}

std::optional<hashlock::address::derived_address> deployment_address(
    const address_t& oracle_program,
    const std::string_view image_id) {
  auto image_hash = hashlock::crypto::sha256(image_id);
  return hashlock::address::find_program_address(
      {make_bytes_view(kDeploymentSeed),
       bytes_view_t{image_hash.data(), image_hash.size()}},
      oracle_program);
}

instruction_t make_execute_instruction(const address_t& oracle_program,
                                       const address_t& requester,
                                       const address_t& payer,
                                       const address_t& execution,
                                       const address_t& deployment,
                                       const execution_request_t& request) {
  auto ix = instruction_t{};
  ix.program_id = oracle_program;
  ix.accounts = {make_writable_meta(requester, true),
                 make_writable_meta(payer, true),
                 make_readonly_meta(hashlock::runtime::system::kProgramId),
                 make_writable_meta(execution),
                 make_readonly_meta(deployment)};
  if (request.callback.has_value()) {
    ix.accounts.push_back(make_readonly_meta(request.callback->program_id));
    ix.accounts.insert(std::end(ix.accounts),
                       std::begin(request.callback->extra_accounts),
                       std::end(request.callback->extra_accounts));
  }

  auto encoder = encoding::scale_encoder_t{};
  ix.data = bytes_t{static_cast<uint8_t>(opcode::execute)};
  encoder.encode(request, ix.data);
  return ix;
}

}  // namespace hashlock::oracle
