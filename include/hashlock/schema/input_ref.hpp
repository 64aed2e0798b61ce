#pragma once

#include <array>
#include <cstdint>
#include <hashlock/schema/enum_string.hpp>
#include <hashlock/schema/primitives.hpp>
#include <optional>
#include <string_view>

// Schema type: oracle input reference.
// Oracle workflow: one input of a verifiable computation. `url` and
// `private_url` carry a locator the prover fetches; `public_data` is inline.
namespace hashlock::schema {

enum class input_type_t : uint8_t {
  public_data = 0,
  url = 1,
  private_url = 2,
};

inline constexpr auto kInputTypeMappings = std::array{
    std::pair<std::string_view, input_type_t>{"public_data",
                                              input_type_t::public_data},
    std::pair<std::string_view, input_type_t>{"url", input_type_t::url},
    std::pair<std::string_view, input_type_t>{"private_url",
                                              input_type_t::private_url},
};

inline constexpr std::string_view to_string(const input_type_t value) {
  return to_string(value, kInputTypeMappings).value_or("unknown");
}

template <uint16_t Version>
struct input_ref;

template <>
struct input_ref<1> final {
  input_type_t type{};
  bytes_t data;

  bool operator==(const input_ref<1>&) const = default;
};

using input_ref_t = input_ref<1>;

inline input_ref_t make_url_input(const bytes_view_t& locator) {
  return input_ref_t{.type = input_type_t::url, .data = make_bytes(locator)};
}

inline input_ref_t make_private_input(const bytes_view_t& locator) {
  return input_ref_t{.type = input_type_t::private_url,
                     .data = make_bytes(locator)};
}

}  // namespace hashlock::schema
