#include <gtest/gtest.h>
#include <array>
#include <hashlock/address/program_address.hpp>
#include <hashlock/crypto/sha256.hpp>
#include <hashlock/testing/common.hpp>
#include <string_view>
#include <vector>

namespace {

hashlock::schema::bytes_view_t view(const std::string_view text) {
  return hashlock::schema::make_bytes_view(text);
}

}  // namespace

TEST(program_address, curve_points_are_detected) {
  // Compressed edwards25519 base point and identity.
  auto base = hashlock::schema::make_hash32(std::string_view{
      "5866666666666666666666666666666666666666666666666666666666666666"});
  auto identity = hashlock::schema::make_hash32(std::string_view{
      "0100000000000000000000000000000000000000000000000000000000000000"});
  EXPECT_TRUE(hashlock::address::is_on_curve(base));
  EXPECT_TRUE(hashlock::address::is_on_curve(identity));
}

TEST(program_address, derived_addresses_are_off_curve_and_deterministic) {
  auto program = hashlock::testing::make_hash(0xE0);
  auto first = hashlock::address::find_program_address({view("s1")}, program);
  auto second = hashlock::address::find_program_address({view("s1")}, program);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->address, second->address);
  EXPECT_EQ(first->bump, second->bump);
  EXPECT_FALSE(hashlock::address::is_on_curve(first->address));
}

TEST(program_address, bump_reproduces_the_address) {
  auto program = hashlock::testing::make_hash(0xE0);
  auto derived = hashlock::address::find_program_address({view("seed")}, program);
  ASSERT_TRUE(derived.has_value());

  auto bump = std::array<uint8_t, 1>{derived->bump};
  auto recreated = hashlock::address::create_program_address(
      {view("seed"), hashlock::schema::bytes_view_t{bump.data(), bump.size()}},
      program);
  ASSERT_TRUE(recreated.has_value());
  EXPECT_EQ(*recreated, derived->address);

  // The search starts at 255, so every higher bump lands on the curve.
  for (auto candidate = 255; candidate > derived->bump; --candidate) {
    bump[0] = static_cast<uint8_t>(candidate);
    EXPECT_FALSE(hashlock::address::create_program_address(
                     {view("seed"),
                      hashlock::schema::bytes_view_t{bump.data(), bump.size()}},
                     program)
                     .has_value());
  }
}

TEST(program_address, address_is_sha256_of_seeds_program_and_marker) {
  auto program = hashlock::testing::make_hash(3);
  auto derived = hashlock::address::find_program_address({view("abc")}, program);
  ASSERT_TRUE(derived.has_value());
  auto bump = std::array<uint8_t, 1>{derived->bump};
  auto expected = hashlock::crypto::sha256(
      {view("abc"), hashlock::schema::bytes_view_t{bump.data(), bump.size()},
       hashlock::schema::bytes_view_t{program.data(), program.size()},
       view(hashlock::address::kProgramDerivedMarker)});
  EXPECT_EQ(derived->address, expected);
}

TEST(program_address, different_seeds_or_programs_give_different_addresses) {
  auto program = hashlock::testing::make_hash(0xE0);
  auto other_program = hashlock::testing::make_hash(0xE1);
  auto a = hashlock::address::find_program_address({view("s1")}, program);
  auto b = hashlock::address::find_program_address({view("s2")}, program);
  auto c = hashlock::address::find_program_address({view("s1")}, other_program);
  ASSERT_TRUE(a && b && c);
  EXPECT_NE(a->address, b->address);
  EXPECT_NE(a->address, c->address);
}

TEST(program_address, seed_limits_are_enforced) {
  auto program = hashlock::testing::make_hash(0xE0);
  auto long_seed = std::vector<uint8_t>(hashlock::address::kMaxSeedLength + 1, 7);
  EXPECT_FALSE(hashlock::address::find_program_address(
                   {hashlock::schema::bytes_view_t{long_seed.data(),
                                                   long_seed.size()}},
                   program)
                   .has_value());

  auto max_seed = std::vector<uint8_t>(hashlock::address::kMaxSeedLength, 7);
  EXPECT_TRUE(hashlock::address::find_program_address(
                  {hashlock::schema::bytes_view_t{max_seed.data(),
                                                  max_seed.size()}},
                  program)
                  .has_value());

  // The bump takes the last seed slot.
  auto too_many = hashlock::address::seeds_t(hashlock::address::kMaxSeeds,
                                             view("x"));
  EXPECT_FALSE(
      hashlock::address::find_program_address(too_many, program).has_value());
  too_many.pop_back();
  EXPECT_TRUE(
      hashlock::address::find_program_address(too_many, program).has_value());
}
