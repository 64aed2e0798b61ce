#include <gtest/gtest.h>
#include <array>
#include <functional>
#include <hashlock/runtime/executor.hpp>
#include <hashlock/runtime/system_program.hpp>
#include <hashlock/testing/common.hpp>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using hashlock::runtime::account_infos_t;
using hashlock::runtime::invoke_context;
using hashlock::schema::address_t;
using hashlock::schema::bytes_view_t;
using hashlock::schema::program_error;

using body_t = std::function<program_error(
    const address_t&, account_infos_t, const bytes_view_t&, invoke_context&)>;

class lambda_program final : public hashlock::runtime::program {
 public:
  explicit lambda_program(body_t body) : body_{std::move(body)} {}

  program_error process_instruction(const address_t& program_id,
                                    account_infos_t accounts,
                                    const bytes_view_t& data,
                                    invoke_context& context) override {
    return body_(program_id, accounts, data, context);
  }

 private:
  body_t body_;
};

class executor_test : public ::testing::Test {
 protected:
  void SetUp() override {
    programs_[hashlock::runtime::system::kProgramId] =
        std::make_shared<hashlock::runtime::system::program>();
    alice_ = hashlock::testing::make_address(1);
    bob_ = hashlock::testing::make_address(2);
    accounts_[alice_].lamports = 1'000'000;
    accounts_[bob_].lamports = 500;
  }

  void install(const address_t& id, body_t body) {
    programs_[id] = std::make_shared<lambda_program>(std::move(body));
  }

  program_error run(const hashlock::schema::instruction_t& ix,
                    const std::vector<address_t>& signers) {
    auto runner = hashlock::runtime::executor{programs_, accounts_, 10};
    return runner.execute(ix, signers);
  }

  hashlock::runtime::program_registry_t programs_;
  hashlock::runtime::account_set_t accounts_;
  address_t alice_{};
  address_t bob_{};
  address_t program_id_{hashlock::testing::make_hash(0xC0)};
};

}  // namespace

TEST_F(executor_test, system_transfer_moves_lamports) {
  auto ix = hashlock::runtime::system::make_transfer_instruction(alice_, bob_, 100);
  EXPECT_EQ(run(ix, {alice_}), program_error::success);
  EXPECT_EQ(accounts_[alice_].lamports, 999'900u);
  EXPECT_EQ(accounts_[bob_].lamports, 600u);
}

TEST_F(executor_test, top_level_signer_must_be_listed) {
  auto ix = hashlock::runtime::system::make_transfer_instruction(alice_, bob_, 100);
  EXPECT_EQ(run(ix, {}), program_error::missing_signature);
}

TEST_F(executor_test, unknown_program_is_rejected) {
  auto ix = hashlock::schema::instruction_t{
      .program_id = hashlock::testing::make_hash(0x99), .accounts = {}, .data = {}};
  EXPECT_EQ(run(ix, {}), program_error::unknown_program);
}

TEST_F(executor_test, system_transfer_rejects_overdraft) {
  auto ix = hashlock::runtime::system::make_transfer_instruction(bob_, alice_, 501);
  EXPECT_EQ(run(ix, {bob_}), program_error::insufficient_funds);
}

TEST_F(executor_test, signer_privilege_cannot_be_escalated) {
  install(program_id_, [&](const address_t&, account_infos_t accounts,
                           const bytes_view_t&, invoke_context& context) {
    auto transfer =
        hashlock::runtime::system::make_transfer_instruction(alice_, bob_, 1);
    return context.invoke(transfer, accounts);
  });
  auto ix = hashlock::schema::instruction_t{
      .program_id = program_id_,
      .accounts = {hashlock::schema::make_writable_meta(alice_),
                   hashlock::schema::make_writable_meta(bob_),
                   hashlock::schema::make_readonly_meta(
                       hashlock::runtime::system::kProgramId)},
      .data = {}};
  EXPECT_EQ(run(ix, {}), program_error::privilege_escalation);
  EXPECT_EQ(accounts_[alice_].lamports, 1'000'000u);
}

TEST_F(executor_test, writable_privilege_cannot_be_escalated) {
  install(program_id_, [&](const address_t&, account_infos_t accounts,
                           const bytes_view_t&, invoke_context& context) {
    auto transfer =
        hashlock::runtime::system::make_transfer_instruction(alice_, bob_, 1);
    return context.invoke(transfer, accounts);
  });
  auto ix = hashlock::schema::instruction_t{
      .program_id = program_id_,
      .accounts = {hashlock::schema::make_writable_meta(alice_, true),
                   hashlock::schema::make_readonly_meta(bob_),
                   hashlock::schema::make_readonly_meta(
                       hashlock::runtime::system::kProgramId)},
      .data = {}};
  EXPECT_EQ(run(ix, {alice_}), program_error::privilege_escalation);
}

TEST_F(executor_test, invoked_accounts_must_be_passed_in) {
  install(program_id_, [&](const address_t&, account_infos_t accounts,
                           const bytes_view_t&, invoke_context& context) {
    auto transfer =
        hashlock::runtime::system::make_transfer_instruction(alice_, bob_, 1);
    return context.invoke(transfer, accounts);
  });
  auto ix = hashlock::schema::instruction_t{
      .program_id = program_id_,
      .accounts = {hashlock::schema::make_writable_meta(alice_, true),
                   hashlock::schema::make_writable_meta(bob_)},
      .data = {}};
  EXPECT_EQ(run(ix, {alice_}), program_error::not_enough_account_keys);
}

TEST_F(executor_test, program_cannot_debit_accounts_it_does_not_own) {
  install(program_id_, [](const address_t&, account_infos_t accounts,
                          const bytes_view_t&, invoke_context&) {
    accounts[0].account->lamports -= 10;
    accounts[1].account->lamports += 10;
    return program_error::success;
  });
  auto ix = hashlock::schema::instruction_t{
      .program_id = program_id_,
      .accounts = {hashlock::schema::make_writable_meta(alice_, true),
                   hashlock::schema::make_writable_meta(bob_)},
      .data = {}};
  EXPECT_EQ(run(ix, {alice_}), program_error::illegal_owner);
}

TEST_F(executor_test, program_cannot_write_data_it_does_not_own) {
  install(program_id_, [](const address_t&, account_infos_t accounts,
                          const bytes_view_t&, invoke_context&) {
    accounts[0].data().push_back(1);
    return program_error::success;
  });
  auto ix = hashlock::schema::instruction_t{
      .program_id = program_id_,
      .accounts = {hashlock::schema::make_writable_meta(bob_)},
      .data = {}};
  EXPECT_EQ(run(ix, {}), program_error::illegal_owner);
}

TEST_F(executor_test, readonly_accounts_cannot_change) {
  auto owned = hashlock::testing::make_address(3);
  accounts_[owned].owner = program_id_;
  accounts_[owned].data = {0, 0};
  install(program_id_, [](const address_t&, account_infos_t accounts,
                          const bytes_view_t&, invoke_context&) {
    accounts[0].data()[0] = 9;
    return program_error::success;
  });
  auto ix = hashlock::schema::instruction_t{
      .program_id = program_id_,
      .accounts = {hashlock::schema::make_readonly_meta(owned)},
      .data = {}};
  EXPECT_EQ(run(ix, {}), program_error::account_not_writable);
}

TEST_F(executor_test, lamports_must_be_conserved) {
  auto owned = hashlock::testing::make_address(3);
  accounts_[owned].owner = program_id_;
  install(program_id_, [](const address_t&, account_infos_t accounts,
                          const bytes_view_t&, invoke_context&) {
    accounts[0].account->lamports += 1;
    return program_error::success;
  });
  auto ix = hashlock::schema::instruction_t{
      .program_id = program_id_,
      .accounts = {hashlock::schema::make_writable_meta(owned)},
      .data = {}};
  EXPECT_EQ(run(ix, {}), program_error::unbalanced_instruction);
}

TEST_F(executor_test, program_signs_for_its_derived_address) {
  auto seed = std::string_view{"vault"};
  auto derived = hashlock::address::find_program_address(
      {hashlock::schema::make_bytes_view(seed)}, program_id_);
  ASSERT_TRUE(derived.has_value());
  install(program_id_, [&](const address_t& self, account_infos_t accounts,
                           const bytes_view_t&, invoke_context& context) {
    auto create = hashlock::runtime::system::make_create_account_instruction(
        alice_, derived->address, 1'000, 16, self);
    auto bump = std::array<uint8_t, 1>{derived->bump};
    auto result = context.invoke_signed(
        create, accounts,
        {{hashlock::schema::make_bytes_view(seed),
          bytes_view_t{bump.data(), bump.size()}}});
    if (result != program_error::success) {
      return result;
    }
    // Freshly assigned, so this program may write it.
    accounts[1].data()[0] = 0xAA;
    return program_error::success;
  });
  auto ix = hashlock::schema::instruction_t{
      .program_id = program_id_,
      .accounts = {hashlock::schema::make_writable_meta(alice_, true),
                   hashlock::schema::make_writable_meta(derived->address),
                   hashlock::schema::make_readonly_meta(
                       hashlock::runtime::system::kProgramId)},
      .data = {}};
  ASSERT_EQ(run(ix, {alice_}), program_error::success);
  const auto& created = accounts_[derived->address];
  EXPECT_EQ(created.owner, program_id_);
  EXPECT_EQ(created.lamports, 1'000u);
  ASSERT_EQ(created.data.size(), 16u);
  EXPECT_EQ(created.data[0], 0xAA);
  EXPECT_EQ(accounts_[alice_].lamports, 999'000u);
}

TEST_F(executor_test, wrong_seeds_do_not_sign) {
  auto derived = hashlock::address::find_program_address(
      {hashlock::schema::make_bytes_view(std::string_view{"vault"})},
      program_id_);
  ASSERT_TRUE(derived.has_value());
  install(program_id_, [&](const address_t& self, account_infos_t accounts,
                           const bytes_view_t&, invoke_context& context) {
    auto create = hashlock::runtime::system::make_create_account_instruction(
        alice_, derived->address, 1'000, 16, self);
    auto bump = std::array<uint8_t, 1>{derived->bump};
    return context.invoke_signed(
        create, accounts,
        {{hashlock::schema::make_bytes_view(std::string_view{"other"}),
          bytes_view_t{bump.data(), bump.size()}}});
  });
  auto ix = hashlock::schema::instruction_t{
      .program_id = program_id_,
      .accounts = {hashlock::schema::make_writable_meta(alice_, true),
                   hashlock::schema::make_writable_meta(derived->address),
                   hashlock::schema::make_readonly_meta(
                       hashlock::runtime::system::kProgramId)},
      .data = {}};
  auto result = run(ix, {alice_});
  EXPECT_TRUE(result == program_error::privilege_escalation ||
              result == program_error::invalid_seeds);
  EXPECT_FALSE(accounts_[derived->address].lamports > 0);
}

TEST_F(executor_test, failed_invocation_fails_the_caller) {
  install(program_id_, [&](const address_t&, account_infos_t accounts,
                           const bytes_view_t&, invoke_context& context) {
    auto transfer = hashlock::runtime::system::make_transfer_instruction(
        alice_, bob_, 10'000'000);
    // The error is dropped on purpose.
    (void)context.invoke(transfer, accounts);
    return program_error::success;
  });
  auto ix = hashlock::schema::instruction_t{
      .program_id = program_id_,
      .accounts = {hashlock::schema::make_writable_meta(alice_, true),
                   hashlock::schema::make_writable_meta(bob_),
                   hashlock::schema::make_readonly_meta(
                       hashlock::runtime::system::kProgramId)},
      .data = {}};
  EXPECT_EQ(run(ix, {alice_}), program_error::insufficient_funds);
}

TEST_F(executor_test, invocation_depth_is_bounded) {
  auto depth = 0;
  install(program_id_, [&](const address_t& self, account_infos_t accounts,
                           const bytes_view_t&, invoke_context& context) {
    ++depth;
    auto again = hashlock::schema::instruction_t{
        .program_id = self,
        .accounts = {hashlock::schema::make_readonly_meta(self)},
        .data = {}};
    return context.invoke(again, accounts);
  });
  auto ix = hashlock::schema::instruction_t{
      .program_id = program_id_,
      .accounts = {hashlock::schema::make_readonly_meta(program_id_)},
      .data = {}};
  EXPECT_EQ(run(ix, {}), program_error::call_depth_exceeded);
  EXPECT_EQ(depth, static_cast<int>(hashlock::runtime::kMaxInvokeDepth));
}

TEST_F(executor_test, events_are_collected_in_order) {
  install(program_id_, [](const address_t&, account_infos_t,
                          const bytes_view_t&, invoke_context& context) {
    context.emit(hashlock::schema::make_event("first", {}));
    context.emit(hashlock::schema::make_event("second", {}));
    return program_error::success;
  });
  auto ix = hashlock::schema::instruction_t{
      .program_id = program_id_, .accounts = {}, .data = {}};
  auto runner = hashlock::runtime::executor{programs_, accounts_, 10};
  ASSERT_EQ(runner.execute(ix, {}), program_error::success);
  ASSERT_EQ(runner.events().size(), 2u);
  EXPECT_EQ(runner.events()[0].type, "first");
  EXPECT_EQ(runner.events()[1].type, "second");
}
