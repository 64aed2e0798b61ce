#pragma once
#include <blake3.h>
#include <cstdint>
#include <hashlock/schema/primitives.hpp>
#include <span>
#include <string_view>

namespace hashlock::blake3 {

hashlock::schema::hash32_t hash(const std::string_view& str);
hashlock::schema::hash32_t hash(const hashlock::schema::bytes_view_t& bytes);

/// Incremental BLAKE3 over several byte ranges.
class hasher final {
 public:
  hasher();

  hasher& update(const hashlock::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);
  hashlock::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

}  // namespace hashlock::blake3
