#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hashlock::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using mutable_bytes_view_t = std::span<uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = hash32_t;
using lamports_t = uint64_t;
using slot_t = uint64_t;

using ed25519_signature_t = std::array<uint8_t, 64>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(const std::string_view encoded);
bytes_t from_base64(const std::string_view encoded);

/// True when `bytes` is well-formed UTF-8 (no overlongs, no surrogates).
bool is_valid_utf8(const bytes_view_t& bytes);

/// Strip leading/trailing ASCII whitespace.
std::string_view trim_ascii_whitespace(std::string_view value);

}  // namespace hashlock::schema
