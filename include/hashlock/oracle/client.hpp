#pragma once

#include <cstdint>
#include <hashlock/address/program_address.hpp>
#include <hashlock/schema/execution_request.hpp>
#include <hashlock/schema/instruction.hpp>
#include <optional>
#include <string_view>

// Outbound half of the oracle interface: the execute request a program sends
// to the verifiable-computation oracle, and the oracle's account addresses.
namespace hashlock::oracle {

enum class opcode : uint8_t {
  execute = 0,
};

inline constexpr std::string_view kExecutionSeed{"execution"};
inline constexpr std::string_view kDeploymentSeed{"deployment"};

/// Execution account the oracle creates for `(requester, execution_id)`.
std::optional<hashlock::address::derived_address> execution_address(
    const hashlock::schema::address_t& oracle_program,
    const hashlock::schema::address_t& requester,
    const hashlock::schema::bytes_view_t& execution_id);

/// Deployment account holding the registered program image `image_id`.
std::optional<hashlock::address::derived_address> deployment_address(
    const hashlock::schema::address_t& oracle_program,
    std::string_view image_id);

/// Build the oracle execute instruction.
///
/// Account order: requester (signer, writable), payer (signer, writable),
/// system program, execution (writable), deployment, then the callback
/// program and its extra accounts when `request.callback` is set.
/// Data: opcode `execute` followed by the SCALE encoding of `request`.
hashlock::schema::instruction_t make_execute_instruction(
    const hashlock::schema::address_t& oracle_program,
    const hashlock::schema::address_t& requester,
    const hashlock::schema::address_t& payer,
    const hashlock::schema::address_t& execution,
    const hashlock::schema::address_t& deployment,
    const hashlock::schema::execution_request_t& request);

}  // namespace hashlock::oracle
