#include <gtest/gtest.h>
#include <sys/wait.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <hashlock/crypto/sha256.hpp>
#include <hashlock/escrow/instruction.hpp>
#include <hashlock/execution/engine.hpp>
#include <hashlock/schema/encoding/layout/encoder.hpp>
#include <hashlock/schema/encoding/scale/encoder.hpp>
#include <hashlock/schema/escrow_record.hpp>
#include <hashlock/schema/primitives.hpp>
#include <hashlock/schema/transaction.hpp>
#include <string>
#include <string_view>
#include <utility>

#ifndef HASHLOCK_TRANSACTION_BUILDER_PATH
#define HASHLOCK_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = hashlock::schema::encoding::scale_encoder_t;

constexpr auto kProgramId =
    "e0e1e2e3e4e5e6e7e8e9eaebecedeeeff0f1f2f3f4f5f6f7f8f9fafbfcfdfeff";
constexpr auto kOracleId =
    "0a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20212223242526272829";
constexpr auto kInitializer =
    "1111111111111111111111111111111111111111111111111111111111111111";
constexpr auto kReceiver =
    "2222222222222222222222222222222222222222222222222222222222222222";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_builder(const std::string& builder,
                        const std::string_view args) {
  auto command = shell_quote(builder) + " " + std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return std::string{hashlock::schema::trim_ascii_whitespace(output)};
}

std::string builder_path() {
  return std::string{HASHLOCK_TRANSACTION_BUILDER_PATH};
}

bool builder_available(const std::string& builder) {
  return !builder.empty() && std::filesystem::exists(builder);
}

}  // namespace

TEST(transaction_builder, digest_prints_lowercase_sha256_hex) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  EXPECT_EQ(run_builder(builder, "digest --preimage abc"),
            hashlock::crypto::sha256_hex(std::string_view{"abc"}));
}

TEST(transaction_builder, derive_matches_escrow_address) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto seed = std::string{"order-42"};
  auto expected = hashlock::escrow::escrow_address(
      hashlock::schema::make_hash32(std::string_view{kProgramId}),
      hashlock::schema::make_bytes_view(seed));
  ASSERT_TRUE(expected.has_value());

  auto actual = run_builder(builder, std::string{"derive --program-id "} +
                                         kProgramId + " --seed " + seed);
  EXPECT_EQ(actual, hashlock::schema::to_hex(expected->address) + " " +
                        std::to_string(expected->bump));
}

TEST(transaction_builder, initialize_emits_decodable_transaction) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto tx_b64 = run_builder(
      builder, std::string{"initialize --escrow-program-id "} + kProgramId +
                   " --initializer " + kInitializer +
                   " --seed order-42 --preimage hunter2 --amount 1000");
  auto tx_bytes = hashlock::schema::from_base64(tx_b64);
  auto tx = encoder_t{}.decode<hashlock::schema::transaction_t>(
      hashlock::schema::make_bytes_view(tx_bytes));

  auto initializer = hashlock::schema::make_hash32(std::string_view{kInitializer});
  ASSERT_EQ(tx.signers.size(), 1u);
  EXPECT_EQ(tx.signers.front(), initializer);
  EXPECT_TRUE(tx.signatures.empty());

  auto args = hashlock::escrow::initialize_args{};
  args.seed = hashlock::schema::make_bytes(std::string_view{"order-42"});
  auto digest = hashlock::crypto::sha256_hex(std::string_view{"hunter2"});
  std::copy(std::begin(digest), std::end(digest),
            std::begin(args.committed_digest));
  args.amount = 1000;
  auto expected = hashlock::escrow::make_initialize_instruction(
      hashlock::schema::make_hash32(std::string_view{kProgramId}), initializer,
      args);
  EXPECT_EQ(tx.instruction.program_id, expected.program_id);
  EXPECT_EQ(tx.instruction.data, expected.data);
  EXPECT_EQ(tx.instruction.accounts.size(), expected.accounts.size());
}

TEST(transaction_builder, signing_payload_matches_engine) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto common = std::string{"--escrow-program-id "} + kProgramId +
                " --initializer " + kInitializer +
                " --seed order-42 --preimage hunter2 --amount 5";
  auto tx_bytes =
      hashlock::schema::from_base64(run_builder(builder, "initialize " + common));
  auto tx = encoder_t{}.decode<hashlock::schema::transaction_t>(
      hashlock::schema::make_bytes_view(tx_bytes));

  auto payload =
      run_builder(builder, "initialize " + common + " --signing-payload");
  auto expected = hashlock::execution::make_signing_payload(tx);
  EXPECT_EQ(payload,
            hashlock::schema::to_hex(hashlock::schema::make_bytes_view(expected)));
}

TEST(transaction_builder, claim_derives_every_account) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto tx_b64 = run_builder(
      builder, std::string{"claim --escrow-program-id "} + kProgramId +
                   " --oracle-program-id " + kOracleId + " --payer " +
                   kInitializer + " --receiver " + kReceiver +
                   " --execution-id exec-00000000001 --seed order-42"
                   " --preimage hunter2 --tip 7");
  auto tx_bytes = hashlock::schema::from_base64(tx_b64);
  auto tx = encoder_t{}.decode<hashlock::schema::transaction_t>(
      hashlock::schema::make_bytes_view(tx_bytes));
  EXPECT_EQ(tx.instruction.accounts.size(), 9u);
  ASSERT_FALSE(tx.instruction.data.empty());
  EXPECT_EQ(tx.instruction.data.front(),
            static_cast<uint8_t>(hashlock::escrow::opcode::claim));

  auto parsed = hashlock::escrow::parse_claim(
      hashlock::schema::make_bytes_view(tx.instruction.data).subspan(1));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->tip, 7u);
  EXPECT_EQ(hashlock::schema::make_string(parsed->preimage), "hunter2");
}

TEST(transaction_builder, claim_pads_short_execution_id) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto tx_b64 = run_builder(
      builder, std::string{"claim --escrow-program-id "} + kProgramId +
                   " --oracle-program-id " + kOracleId + " --payer " +
                   kInitializer + " --receiver " + kReceiver +
                   " --execution-id ex1234567890ab --seed s1 --preimage abc");
  auto tx_bytes = hashlock::schema::from_base64(tx_b64);
  auto tx = encoder_t{}.decode<hashlock::schema::transaction_t>(
      hashlock::schema::make_bytes_view(tx_bytes));
  ASSERT_FALSE(tx.instruction.data.empty());
  auto parsed = hashlock::escrow::parse_claim(
      hashlock::schema::make_bytes_view(tx.instruction.data).subspan(1));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->execution_id,
            hashlock::escrow::make_execution_id("ex1234567890ab"));

  auto [exit_code, output] = run_capture(
      shell_quote(builder) + " claim --escrow-program-id " + kProgramId +
      " --oracle-program-id " + kOracleId + " --payer " + kInitializer +
      " --receiver " + kReceiver +
      " --execution-id exec-000000000001 --seed s1 --preimage abc 2>/dev/null");
  EXPECT_NE(exit_code, 0);
}

TEST(transaction_builder, decode_escrow_reports_record_fields) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto record = hashlock::schema::escrow_record_t{};
  record.amount = 1234;
  auto digest = hashlock::crypto::sha256_hex(std::string_view{"hunter2"});
  std::copy(std::begin(digest), std::end(digest),
            std::begin(record.committed_digest));
  record.initializer = hashlock::schema::make_hash32(std::string_view{kInitializer});
  auto image = hashlock::schema::encoding::layout_encoder_t{}.encode(record);

  auto output = run_builder(
      builder, "decode-escrow --data-hex " +
                   hashlock::schema::to_hex(hashlock::schema::make_bytes_view(image)));
  EXPECT_NE(output.find("amount=1234"), std::string::npos);
  EXPECT_NE(output.find("committed_digest=" + digest), std::string::npos);
  EXPECT_NE(output.find("is_claimed=false"), std::string::npos);
  EXPECT_NE(output.find("receiver=none"), std::string::npos);
  EXPECT_NE(output.find(std::string{"initializer="} + kInitializer),
            std::string::npos);
}

TEST(transaction_builder, rejects_unknown_command) {
  auto builder = builder_path();
  if (!builder_available(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }
  auto [exit_code, output] =
      run_capture(shell_quote(builder) + " frobnicate 2>/dev/null");
  EXPECT_NE(exit_code, 0);
}
