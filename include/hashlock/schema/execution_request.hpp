#pragma once

#include <cstdint>
#include <hashlock/schema/account_meta.hpp>
#include <hashlock/schema/input_ref.hpp>
#include <hashlock/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

// Schema type: oracle execution request.
// Oracle workflow: what a requester asks the verifiable-computation oracle to
// run, what it pays, when the request lapses, and where the result goes.
namespace hashlock::schema {

template <uint16_t Version>
struct execution_config;

template <>
struct execution_config<1> final {
  bool verify_input_hash{};
  std::optional<hash32_t> input_hash;
  bool forward_output{};

  bool operator==(const execution_config<1>&) const = default;
};

using execution_config_t = execution_config<1>;

template <uint16_t Version>
struct callback_config;

/// Callback target. The oracle invokes `program_id` with
/// `instruction_prefix || callback_payload` and the account list
/// `[execution (signer)] ++ extra_accounts`.
template <>
struct callback_config<1> final {
  address_t program_id{};
  bytes_t instruction_prefix;
  std::vector<account_meta_t> extra_accounts;

  bool operator==(const callback_config<1>&) const = default;
};

using callback_config_t = callback_config<1>;

template <uint16_t Version>
struct execution_request;

template <>
struct execution_request<1> final {
  uint16_t version{1};
  std::string image_id;
  bytes_t execution_id;
  std::vector<input_ref_t> inputs;
  lamports_t tip{};
  slot_t expiration{};
  execution_config_t config;
  std::optional<callback_config_t> callback;

  bool operator==(const execution_request<1>&) const = default;
};

using execution_request_t = execution_request<1>;

template <uint16_t Version>
struct callback_payload;

/// Body of the callback instruction, after the callback's
/// `instruction_prefix`.
template <>
struct callback_payload<1> final {
  uint16_t version{1};
  std::string image_id;
  bytes_t execution_id;
  hash32_t input_digest{};
  bytes_t committed_outputs;

  bool operator==(const callback_payload<1>&) const = default;
};

using callback_payload_t = callback_payload<1>;

}  // namespace hashlock::schema
