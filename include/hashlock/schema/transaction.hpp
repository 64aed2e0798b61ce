#pragma once

#include <hashlock/schema/instruction.hpp>
#include <hashlock/schema/primitives.hpp>
#include <vector>

namespace hashlock::schema {

template <uint16_t Version>
struct transaction;

/// Signed envelope around a single instruction.
///
/// `signatures[i]` is the Ed25519 signature of `signers[i]` over the SCALE
/// encoding of `(version, signers, instruction)`.
template <>
struct transaction<1> final {
  uint16_t version{1};
  std::vector<address_t> signers;
  instruction_t instruction;
  std::vector<ed25519_signature_t> signatures;
};

using transaction_t = transaction<1>;

}  // namespace hashlock::schema
