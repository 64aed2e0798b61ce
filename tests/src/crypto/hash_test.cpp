#include <gtest/gtest.h>
#include <hashlock/blake3/hash.hpp>
#include <hashlock/crypto/sha256.hpp>
#include <string_view>

TEST(crypto_sha256, matches_published_vectors) {
  EXPECT_EQ(hashlock::crypto::sha256_hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(hashlock::crypto::sha256_hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(crypto_sha256, concatenates_parts) {
  auto whole = hashlock::crypto::sha256(std::string_view{"abc"});
  auto split = hashlock::crypto::sha256(
      {hashlock::schema::make_bytes_view(std::string_view{"a"}),
       hashlock::schema::make_bytes_view(std::string_view{}),
       hashlock::schema::make_bytes_view(std::string_view{"bc"})});
  EXPECT_EQ(whole, split);
}

TEST(crypto_sha256, hex_digest_is_lowercase_text) {
  auto digest = hashlock::crypto::sha256_hex("hashlock");
  EXPECT_EQ(digest.size(), 64u);
  for (auto ch : digest) {
    EXPECT_TRUE((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f'));
  }
}

TEST(blake3_hash, empty_input_matches_reference) {
  EXPECT_EQ(hashlock::schema::to_hex(hashlock::blake3::hash(std::string_view{})),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3_hash, incremental_matches_one_shot) {
  auto one_shot = hashlock::blake3::hash(std::string_view{"state-root"});
  auto incremental = hashlock::blake3::hasher{}
                         .update(std::string_view{"state"})
                         .update(std::string_view{"-root"})
                         .finalize();
  EXPECT_EQ(one_shot, incremental);
}
