#include <spdlog/spdlog.h>
#include <algorithm>
#include <hashlock/address/program_address.hpp>
#include <hashlock/blake3/hash.hpp>
#include <hashlock/common/critical.hpp>
#include <hashlock/crypto/verify.hpp>
#include <hashlock/execution/engine.hpp>
#include <hashlock/runtime/system_program.hpp>
#include <hashlock/schema/encoding/layout/encoder.hpp>
#include <hashlock/schema/escrow_record.hpp>
#include <hashlock/schema/key/engine_keys.hpp>
#include <iterator>
#include <tuple>
#include <utility>

using namespace hashlock::schema;

namespace {

using encoder_t = hashlock::schema::encoding::scale_encoder_t;

inline constexpr auto kTxCodespace = std::string_view{"hashlock.tx"};
inline constexpr auto kCheckCodespace = std::string_view{"hashlock.checktx"};
inline constexpr auto kQueryCodespace = std::string_view{"hashlock.query"};
inline constexpr auto kRuntimeCodespace = std::string_view{"hashlock.runtime"};

enum class envelope_error : uint32_t {
  invalid_transaction = 1,
  unsupported_version = 2,
  signature_count_mismatch = 3,
  invalid_signature = 4,
};

enum class query_error : uint32_t {
  unsupported_path = 1,
  invalid_key = 2,
  not_found = 3,
};

hashlock::schema::hash32_t fold_state_root(const hashlock::schema::hash32_t& seed,
                                           const hashlock::schema::bytes_t& tx,
                                           uint64_t slot,
                                           uint64_t index) {
  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{slot, index});
  return hashlock::blake3::hasher{}
      .update(bytes_view_t{seed.data(), seed.size()})
      .update(bytes_view_t{tx.data(), tx.size()})
      .update(bytes_view_t{encoded_suffix.data(), encoded_suffix.size()})
      .finalize();
}

std::optional<hashlock::schema::transaction_t> decode_transaction(
    const hashlock::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<hashlock::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction failed to decode";
  }
  return tx;
}

transaction_result_t make_envelope_error(const envelope_error code,
                                         std::string log,
                                         std::string info,
                                         const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(const query_error code,
                                std::string log,
                                const slot_t slot) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.slot = slot;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

}  // namespace

namespace hashlock::execution {

bytes_t make_signing_payload(const transaction_t& tx) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{tx.version, tx.signers, tx.instruction});
}

engine::engine(encoding::scale_encoder_t& encoder,
               storage::rocksdb_storage_t& storage,
               bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{hashlock::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  programs_[hashlock::runtime::system::kProgramId] =
      std::make_shared<hashlock::runtime::system::program>();
  program_names_[hashlock::runtime::system::kProgramId] = "system";

  if (require_strict_crypto_ && !hashlock::crypto::available()) {
    spdlog::warn("Strict crypto requested but Ed25519 is unavailable");
  }
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; signatures are not verified");
  }
  spdlog::info("Execution engine ready at slot {}", last_committed_slot_);
}

void engine::register_program(const address_t& program_id,
                              std::shared_ptr<hashlock::runtime::program> program,
                              std::string name) {
  auto lock = std::scoped_lock{mutex_};
  if (!program) {
    hashlock::common::critical("cannot register an empty program");
  }
  spdlog::info("Registered program '{}' at {}", name, to_hex(program_id));
  programs_[program_id] = std::move(program);
  program_names_[program_id] = std::move(name);
}

void engine::airdrop(const address_t& address, const lamports_t lamports) {
  auto lock = std::scoped_lock{mutex_};
  auto current = load_account(address).value_or(account_t{});
  current.lamports += lamports;
  pending_accounts_[address] = current;

  auto encoder = encoder_t{};
  auto material = encoder.encode(std::tuple{address, lamports});
  pending_state_root_ =
      hashlock::blake3::hasher{}
          .update(bytes_view_t{pending_state_root_.data(),
                               pending_state_root_.size()})
          .update(std::string_view{"airdrop"})
          .update(bytes_view_t{material.data(), material.size()})
          .finalize();
  spdlog::info("Airdropped {} lamports to {}", lamports, to_hex(address));
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_envelope_error(envelope_error::invalid_transaction,
                               "invalid transaction", decode_error,
                               kCheckCodespace);
  }
  auto lock = std::scoped_lock{mutex_};
  return validate_transaction(*maybe_tx, kCheckCodespace);
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_envelope_error(envelope_error::unsupported_version,
                               "unsupported transaction version",
                               "expected version 1", codespace);
  }
  if (!require_strict_crypto_) {
    return {};
  }
  if (tx.signers.size() != tx.signatures.size()) {
    return make_envelope_error(envelope_error::signature_count_mismatch,
                               "signature count mismatch",
                               "one signature per signer is required",
                               codespace);
  }
  auto message = make_signing_payload(tx);
  for (std::size_t i = 0; i < tx.signers.size(); ++i) {
    if (!signature_verifier_(bytes_view_t{message.data(), message.size()},
                             tx.signers[i], tx.signatures[i])) {
      spdlog::warn("Rejected signature from {}", to_hex(tx.signers[i]));
      return make_envelope_error(envelope_error::invalid_signature,
                                 "invalid signature", to_hex(tx.signers[i]),
                                 codespace);
    }
  }
  return {};
}

block_result_t engine::finalize_block(const slot_t slot,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = pending_state_root_;
  for (std::size_t i = 0; i < txs.size(); ++i) {
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(
        bytes_view_t{txs[i].data(), txs[i].size()}, decode_error);
    if (!maybe_tx) {
      result.tx_results.push_back(make_envelope_error(
          envelope_error::invalid_transaction, "invalid transaction",
          decode_error, kTxCodespace));
      continue;
    }
    auto validated = validate_transaction(*maybe_tx, kTxCodespace);
    if (validated.code != 0) {
      result.tx_results.push_back(std::move(validated));
      continue;
    }
    auto tx_result = execute_transaction(*maybe_tx, slot);
    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], slot, i);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_slot_ = slot;
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

transaction_result_t engine::execute_transaction(const transaction_t& tx,
                                                 const slot_t slot) {
  auto working = hashlock::runtime::account_set_t{};
  auto load = [&](const address_t& address) {
    if (!working.contains(address)) {
      working[address] = load_account(address).value_or(account_t{});
    }
  };
  load(tx.instruction.program_id);
  for (const auto& meta : tx.instruction.accounts) {
    load(meta.address);
  }

  auto runner = hashlock::runtime::executor{programs_, working, slot};
  auto error = runner.execute(tx.instruction, tx.signers);

  auto result = transaction_result_t{};
  auto named = program_names_.find(tx.instruction.program_id);
  result.codespace = named == std::end(program_names_)
                         ? std::string{kRuntimeCodespace}
                         : "hashlock." + named->second;
  if (error != program_error::success) {
    result.code = to_code(error);
    result.log = std::string{to_string(error)};
    spdlog::warn("Transaction to {} failed: {}",
                 to_hex(tx.instruction.program_id), result.log);
    return result;
  }

  for (auto& [address, account] : working) {
    pending_accounts_[address] = std::move(account);
  }
  result.events = std::move(runner.events());
  result.log = "ok";
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  auto committed_slot = pending_slot_.value_or(last_committed_slot_);

  auto entries = std::vector<hashlock::storage::key_value_entry_t>{};
  entries.reserve(pending_accounts_.size());
  for (const auto& [address, account] : pending_accounts_) {
    entries.emplace_back(hashlock::schema::key::make_account_key(encoder_, address),
                         encoder_.encode(account));
  }
  storage_.commit(entries, hashlock::storage::committed_state{
                               .slot = committed_slot,
                               .state_root = pending_state_root_});

  last_committed_slot_ = committed_slot;
  last_committed_state_root_ = pending_state_root_;
  pending_slot_.reset();
  pending_accounts_.clear();

  spdlog::info("Committed slot {} ({} accounts written)", committed_slot,
               entries.size());
  auto result = commit_result_t{};
  result.committed_slot = last_committed_slot_;
  result.state_root = last_committed_state_root_;
  result.accounts_written = entries.size();
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_committed_slot = last_committed_slot_;
  result.last_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.slot = last_committed_slot_;
  result.key = make_bytes(data);
  result.codespace = std::string{kQueryCodespace};

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        std::string{"hashlock-escrow"}, last_committed_slot_,
        last_committed_state_root_});
    result.info = "engine info";
    return result;
  }

  if (path == "/state/account") {
    if (data.size() != sizeof(address_t)) {
      return make_query_error(query_error::invalid_key,
                              "expected a 32-byte address",
                              last_committed_slot_);
    }
    auto address = address_t{};
    std::ranges::copy(data, std::begin(address));
    auto found = load_committed_account(address);
    if (!found) {
      return make_query_error(query_error::not_found, "account not found",
                              last_committed_slot_);
    }
    result.value = encoder_.encode(*found);
    result.info = to_hex(address);
    return result;
  }

  if (path == "/state/escrow") {
    if (data.size() < sizeof(address_t) ||
        data.size() > sizeof(address_t) + kEscrowSeedLength) {
      return make_query_error(query_error::invalid_key,
                              "expected program id followed by the seed",
                              last_committed_slot_);
    }
    auto program_id = address_t{};
    std::copy_n(std::begin(data), program_id.size(), std::begin(program_id));
    auto escrow = hashlock::address::find_program_address(
        {data.subspan(sizeof(address_t))}, program_id);
    if (!escrow) {
      return make_query_error(query_error::invalid_key,
                              "seed does not derive an address",
                              last_committed_slot_);
    }
    auto found = load_committed_account(escrow->address);
    if (!found || found->owner != program_id) {
      return make_query_error(query_error::not_found, "escrow not found",
                              last_committed_slot_);
    }
    auto layout = encoding::layout_encoder_t{};
    auto record = layout.try_decode<escrow_record_t>(make_bytes_view(found->data));
    if (!record) {
      return make_query_error(query_error::not_found,
                              "escrow account holds no record",
                              last_committed_slot_);
    }
    result.value = encoder_.encode(*record);
    result.info = to_hex(escrow->address);
    return result;
  }

  return make_query_error(query_error::unsupported_path,
                          "unsupported query path", last_committed_slot_);
}

std::optional<account_t> engine::account(const address_t& address) const {
  auto lock = std::scoped_lock{mutex_};
  return load_account(address);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::debug("Ignoring signature verifier; strict crypto is disabled");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

std::optional<account_t> engine::load_account(const address_t& address) const {
  auto pending = pending_accounts_.find(address);
  if (pending != std::end(pending_accounts_)) {
    return pending->second;
  }
  return load_committed_account(address);
}

std::optional<account_t> engine::load_committed_account(
    const address_t& address) const {
  auto key = hashlock::schema::key::make_account_key(encoder_, address);
  return storage_.get<account_t>(encoder_, bytes_view_t{key.data(), key.size()});
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_slot_ = committed->slot;
    last_committed_state_root_ = committed->state_root;
  }
  pending_state_root_ = last_committed_state_root_;
}

}  // namespace hashlock::execution
