#include <algorithm>
#include <cctype>
#include <hashlock/common/critical.hpp>
#include <hashlock/schema/primitives.hpp>
#include <iterator>
#include <string_view>

namespace hashlock::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<uint8_t> base64_value(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<uint8_t>(ch - 'A');
  }
  if (ch >= 'a' && ch <= 'z') {
    return static_cast<uint8_t>(ch - 'a' + 26);
  }
  if (ch >= '0' && ch <= '9') {
    return static_cast<uint8_t>(ch - '0' + 52);
  }
  if (ch == '+') {
    return uint8_t{62};
  }
  if (ch == '/') {
    return uint8_t{63};
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    hashlock::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash.has_value()) {
    hashlock::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const hash32_t& bytes) {
  return to_hex(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    hashlock::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  static constexpr auto kTable =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto index = size_t{0};
  while ((index + 3) <= bytes.size()) {
    auto value = (static_cast<uint32_t>(bytes[index]) << 16u) |
                 (static_cast<uint32_t>(bytes[index + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[index + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    index += 3;
  }

  if (index < bytes.size()) {
    auto value = static_cast<uint32_t>(bytes[index]) << 16u;
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    if ((index + 1) < bytes.size()) {
      value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back(kTable[(value >> 6u) & 0x3Fu]);
      out.push_back('=');
    } else {
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back('=');
      out.push_back('=');
    }
  }

  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  for (const auto ch : encoded) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    compact.push_back(ch);
  }

  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);

  for (size_t i = 0; i < compact.size(); i += 4) {
    auto is_last_chunk = (i + 4) == compact.size();
    auto v0 = base64_value(compact[i]);
    auto v1 = base64_value(compact[i + 1]);
    if (!v0 || !v1) {
      return std::nullopt;
    }
    auto value = (static_cast<uint32_t>(*v0) << 18u) |
                 (static_cast<uint32_t>(*v1) << 12u);

    if (compact[i + 2] == '=') {
      if (compact[i + 3] != '=' || !is_last_chunk) {
        return std::nullopt;
      }
      out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
      continue;
    }
    auto v2 = base64_value(compact[i + 2]);
    if (!v2) {
      return std::nullopt;
    }
    value |= static_cast<uint32_t>(*v2) << 6u;

    if (compact[i + 3] == '=') {
      if (!is_last_chunk) {
        return std::nullopt;
      }
      out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
      continue;
    }
    auto v3 = base64_value(compact[i + 3]);
    if (!v3) {
      return std::nullopt;
    }
    value |= static_cast<uint32_t>(*v3);
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    out.push_back(static_cast<uint8_t>(value & 0xFFu));
  }

  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    hashlock::common::critical("invalid base64 input");
  }
  return *decoded;
}

bool is_valid_utf8(const bytes_view_t& bytes) {
  auto i = size_t{0};
  while (i < bytes.size()) {
    auto lead = bytes[i];
    if (lead < 0x80u) {
      ++i;
      continue;
    }

    auto length = size_t{0};
    auto code_point = uint32_t{0};
    auto minimum = uint32_t{0};
    if ((lead & 0xE0u) == 0xC0u) {
      length = 2;
      code_point = lead & 0x1Fu;
      minimum = 0x80u;
    } else if ((lead & 0xF0u) == 0xE0u) {
      length = 3;
      code_point = lead & 0x0Fu;
      minimum = 0x800u;
    } else if ((lead & 0xF8u) == 0xF0u) {
      length = 4;
      code_point = lead & 0x07u;
      minimum = 0x10000u;
    } else {
      return false;
    }

    if (i + length > bytes.size()) {
      return false;
    }
    for (size_t j = 1; j < length; ++j) {
      auto continuation = bytes[i + j];
      if ((continuation & 0xC0u) != 0x80u) {
        return false;
      }
      code_point = (code_point << 6u) | (continuation & 0x3Fu);
    }
    if (code_point < minimum || code_point > 0x10FFFFu ||
        (code_point >= 0xD800u && code_point <= 0xDFFFu)) {
      return false;
    }
    i += length;
  }
  return true;
}

std::string_view trim_ascii_whitespace(std::string_view value) {
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.front())) != 0) {
    value.remove_prefix(1);
  }
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.back())) != 0) {
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace hashlock::schema
