#include <openssl/evp.h>
#include <hashlock/common/critical.hpp>
#include <hashlock/crypto/sha256.hpp>
#include <memory>

namespace hashlock::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

hashlock::schema::hash32_t sha256(
    std::span<const hashlock::schema::bytes_view_t> parts) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    hashlock::common::critical("failed to initialise SHA-256 context");
  }
  for (const auto& part : parts) {
    if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
      hashlock::common::critical("failed to update SHA-256 context");
    }
  }
  auto digest = hashlock::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 ||
      length != digest.size()) {
    hashlock::common::critical("failed to finalise SHA-256 digest");
  }
  return digest;
}

hashlock::schema::hash32_t sha256(
    std::initializer_list<hashlock::schema::bytes_view_t> parts) {
  return sha256(std::span<const hashlock::schema::bytes_view_t>{
      parts.begin(), parts.size()});
}

hashlock::schema::hash32_t sha256(const hashlock::schema::bytes_view_t& bytes) {
  return sha256({bytes});
}

hashlock::schema::hash32_t sha256(const std::string_view& text) {
  return sha256({hashlock::schema::make_bytes_view(text)});
}

std::string sha256_hex(const std::string_view& text) {
  return hashlock::schema::to_hex(sha256(text));
}

}  // namespace hashlock::crypto
