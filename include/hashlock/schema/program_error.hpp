#pragma once

#include <array>
#include <cstdint>
#include <hashlock/schema/enum_string.hpp>
#include <string_view>

// Schema type: program error.
// Escrow workflow: error codes surfaced by the escrow program, the oracle
// adapter, and the host runtime. `success` is the only non-failure value.
namespace hashlock::schema {

enum class program_error : uint32_t {
  success = 0,
  invalid_instruction_data = 1,
  invalid_input = 2,
  address_mismatch = 3,
  seed_mismatch = 4,
  missing_signature = 5,
  already_claimed = 6,
  hash_mismatch = 7,
  malformed_callback = 8,
  oracle_request_rejected = 9,
  buffer_too_small = 10,
  not_enough_account_keys = 11,
  account_not_writable = 12,
  uninitialized_account = 13,
  unauthorized_callback = 14,
  insufficient_funds = 15,
  account_already_in_use = 16,
  illegal_owner = 17,
  unbalanced_instruction = 18,
  privilege_escalation = 19,
  unknown_program = 20,
  invalid_seeds = 21,
  call_depth_exceeded = 22,
};

inline constexpr auto kProgramErrorMappings = std::array{
    std::pair<std::string_view, program_error>{"success",
                                               program_error::success},
    std::pair<std::string_view, program_error>{
        "invalid_instruction_data", program_error::invalid_instruction_data},
    std::pair<std::string_view, program_error>{"invalid_input",
                                               program_error::invalid_input},
    std::pair<std::string_view, program_error>{
        "address_mismatch", program_error::address_mismatch},
    std::pair<std::string_view, program_error>{"seed_mismatch",
                                               program_error::seed_mismatch},
    std::pair<std::string_view, program_error>{
        "missing_signature", program_error::missing_signature},
    std::pair<std::string_view, program_error>{
        "already_claimed", program_error::already_claimed},
    std::pair<std::string_view, program_error>{"hash_mismatch",
                                               program_error::hash_mismatch},
    std::pair<std::string_view, program_error>{
        "malformed_callback", program_error::malformed_callback},
    std::pair<std::string_view, program_error>{
        "oracle_request_rejected", program_error::oracle_request_rejected},
    std::pair<std::string_view, program_error>{
        "buffer_too_small", program_error::buffer_too_small},
    std::pair<std::string_view, program_error>{
        "not_enough_account_keys", program_error::not_enough_account_keys},
    std::pair<std::string_view, program_error>{
        "account_not_writable", program_error::account_not_writable},
    std::pair<std::string_view, program_error>{
        "uninitialized_account", program_error::uninitialized_account},
    std::pair<std::string_view, program_error>{
        "unauthorized_callback", program_error::unauthorized_callback},
    std::pair<std::string_view, program_error>{
        "insufficient_funds", program_error::insufficient_funds},
    std::pair<std::string_view, program_error>{
        "account_already_in_use", program_error::account_already_in_use},
    std::pair<std::string_view, program_error>{"illegal_owner",
                                               program_error::illegal_owner},
    std::pair<std::string_view, program_error>{
        "unbalanced_instruction", program_error::unbalanced_instruction},
    std::pair<std::string_view, program_error>{
        "privilege_escalation", program_error::privilege_escalation},
    std::pair<std::string_view, program_error>{"unknown_program",
                                               program_error::unknown_program},
    std::pair<std::string_view, program_error>{"invalid_seeds",
                                               program_error::invalid_seeds},
    std::pair<std::string_view, program_error>{
        "call_depth_exceeded", program_error::call_depth_exceeded},
};

inline constexpr std::string_view to_string(const program_error value) {
  return to_string(value, kProgramErrorMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const program_error value) {
  return static_cast<uint32_t>(value);
}

}  // namespace hashlock::schema
