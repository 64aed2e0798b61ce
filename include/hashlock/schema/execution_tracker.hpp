#pragma once

#include <hashlock/schema/primitives.hpp>

// Schema type: execution tracker.
// Escrow workflow: correlates one in-flight claim (keyed by execution id) to
// the oracle execution account that will deliver its callback.
namespace hashlock::schema {

template <uint16_t Version>
struct execution_tracker;

template <>
struct execution_tracker<1> final {
  address_t execution_handle{};

  bool operator==(const execution_tracker<1>&) const = default;
};

using execution_tracker_t = execution_tracker<1>;

}  // namespace hashlock::schema
