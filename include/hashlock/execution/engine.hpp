#pragma once

#include <cstdint>
#include <hashlock/execution/signature_verifier.hpp>
#include <hashlock/runtime/executor.hpp>
#include <hashlock/runtime/program.hpp>
#include <hashlock/schema/account.hpp>
#include <hashlock/schema/app_info.hpp>
#include <hashlock/schema/block_result.hpp>
#include <hashlock/schema/commit_result.hpp>
#include <hashlock/schema/encoding/scale/encoder.hpp>
#include <hashlock/schema/primitives.hpp>
#include <hashlock/schema/query_result.hpp>
#include <hashlock/schema/transaction.hpp>
#include <hashlock/schema/transaction_result.hpp>
#include <hashlock/storage/rocksdb/storage.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hashlock::execution {

/// Bytes each signer signs: SCALE of `(version, signers, instruction)`.
hashlock::schema::bytes_t make_signing_payload(
    const hashlock::schema::transaction_t& tx);

/// Deterministic ledger state machine hosting the registered programs.
///
/// Every transaction executes atomically against its own copy of the accounts
/// it names; only successful transactions reach the pending state, and only
/// `commit` makes pending state durable.
class engine final {
 public:
  /// `require_strict_crypto` enables Ed25519 signature verification; when
  /// false, signatures are not checked (local tooling and tests).
  explicit engine(hashlock::schema::encoding::scale_encoder_t& encoder,
                  hashlock::storage::rocksdb_storage_t& storage,
                  bool require_strict_crypto = true);

  /// Host `program` at `program_id`. `name` labels its error codespace.
  void register_program(const hashlock::schema::address_t& program_id,
                        std::shared_ptr<hashlock::runtime::program> program,
                        std::string name);

  /// Credit genesis funds to `address` in pending state.
  void airdrop(const hashlock::schema::address_t& address,
               hashlock::schema::lamports_t lamports);

  /// Admission check: decode and signature validation only. Does not mutate
  /// application state.
  hashlock::schema::transaction_result_t check_transaction(
      const hashlock::schema::bytes_view_t& raw_tx);

  /// Execute `txs` in order at `slot`. Per-transaction results are returned
  /// even on failures.
  hashlock::schema::block_result_t finalize_block(
      hashlock::schema::slot_t slot,
      const std::vector<hashlock::schema::bytes_t>& txs);

  /// Persist pending accounts and the checkpoint in one write batch.
  hashlock::schema::commit_result_t commit();

  /// Return application metadata (latest committed slot and state root).
  hashlock::schema::app_info_t info() const;

  /// Read-path query against committed state.
  ///
  /// Routes: `/engine/info`, `/state/account` (32-byte address),
  /// `/state/escrow` (32-byte escrow program id followed by the seed).
  hashlock::schema::query_result_t query(
      std::string_view path,
      const hashlock::schema::bytes_view_t& data);

  /// Latest view of an account, pending state first.
  std::optional<hashlock::schema::account_t> account(
      const hashlock::schema::address_t& address) const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  hashlock::schema::transaction_result_t validate_transaction(
      const hashlock::schema::transaction_t& tx,
      std::string_view codespace) const;

  hashlock::schema::transaction_result_t execute_transaction(
      const hashlock::schema::transaction_t& tx,
      hashlock::schema::slot_t slot);

  std::optional<hashlock::schema::account_t> load_account(
      const hashlock::schema::address_t& address) const;
  std::optional<hashlock::schema::account_t> load_committed_account(
      const hashlock::schema::address_t& address) const;

  void load_persisted_state();

  mutable std::mutex mutex_;
  hashlock::schema::encoding::scale_encoder_t& encoder_;
  hashlock::storage::rocksdb_storage_t& storage_;
  hashlock::runtime::program_registry_t programs_;
  std::map<hashlock::schema::address_t, std::string> program_names_;
  hashlock::runtime::account_set_t pending_accounts_;
  hashlock::schema::slot_t last_committed_slot_{};
  hashlock::schema::hash32_t last_committed_state_root_{};
  std::optional<hashlock::schema::slot_t> pending_slot_;
  hashlock::schema::hash32_t pending_state_root_{};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace hashlock::execution
