#pragma once

#include <hashlock/schema/account_meta.hpp>
#include <hashlock/schema/primitives.hpp>
#include <vector>

// Schema type: instruction.
// Runtime workflow: one program invocation: target program, ordered account
// handles, and opaque payload bytes interpreted by the program.
namespace hashlock::schema {

template <uint16_t Version>
struct instruction;

template <>
struct instruction<1> final {
  address_t program_id{};
  std::vector<account_meta_t> accounts;
  bytes_t data;

  bool operator==(const instruction<1>&) const = default;
};

using instruction_t = instruction<1>;

}  // namespace hashlock::schema
