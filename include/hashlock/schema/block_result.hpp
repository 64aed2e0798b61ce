#pragma once

#include <cstdint>
#include <hashlock/schema/primitives.hpp>
#include <hashlock/schema/transaction_result.hpp>
#include <vector>

// Schema type: block result.
// Ledger workflow: per-transaction results for one slot plus the candidate
// state root after applying the successful ones.
namespace hashlock::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  std::vector<transaction_result_t> tx_results;
  hash32_t state_root{};
};

using block_result_t = block_result<1>;

}  // namespace hashlock::schema
