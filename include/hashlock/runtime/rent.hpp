#pragma once

#include <cstddef>
#include <cstdint>
#include <hashlock/schema/primitives.hpp>

namespace hashlock::runtime {

/// Rent schedule. An account funded with at least `minimum_balance(space)`
/// is exempt and never collected.
struct rent final {
  uint64_t lamports_per_byte_year{3480};
  uint64_t exemption_threshold_years{2};

  static constexpr std::size_t kAccountStorageOverhead = 128;

  hashlock::schema::lamports_t minimum_balance(const std::size_t space) const {
    return (kAccountStorageOverhead + space) * lamports_per_byte_year *
           exemption_threshold_years;
  }
};

}  // namespace hashlock::runtime
