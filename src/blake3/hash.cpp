#include <hashlock/blake3/hash.hpp>

namespace hashlock::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const hashlock::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hashlock::schema::hash32_t hasher::finalize() const {
  static_assert(BLAKE3_OUT_LEN == hashlock::schema::hash32_t{}.size());
  auto output = hashlock::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

hashlock::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

hashlock::schema::hash32_t hash(const hashlock::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace hashlock::blake3
