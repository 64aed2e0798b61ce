#pragma once

#include <hashlock/schema/primitives.hpp>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

namespace hashlock::crypto {

/// SHA-256 over the concatenation of `parts`.
hashlock::schema::hash32_t sha256(
    std::span<const hashlock::schema::bytes_view_t> parts);
hashlock::schema::hash32_t sha256(
    std::initializer_list<hashlock::schema::bytes_view_t> parts);

hashlock::schema::hash32_t sha256(const hashlock::schema::bytes_view_t& bytes);
hashlock::schema::hash32_t sha256(const std::string_view& text);

/// Lowercase hex text of SHA-256(text), the form committed into escrows.
std::string sha256_hex(const std::string_view& text);

}  // namespace hashlock::crypto
