#include <spdlog/spdlog.h>
#include <algorithm>
#include <hashlock/escrow/instruction.hpp>
#include <hashlock/escrow/program.hpp>
#include <hashlock/oracle/callback.hpp>
#include <hashlock/oracle/client.hpp>
#include <hashlock/runtime/invoke_context.hpp>
#include <hashlock/runtime/system_program.hpp>
#include <hashlock/schema/encoding/layout/encoder.hpp>
#include <hashlock/schema/execution_request.hpp>
#include <iterator>
#include <limits>
#include <string>

using namespace hashlock::schema;
using hashlock::runtime::account_info;
using hashlock::runtime::account_infos_t;
using hashlock::runtime::invoke_context;

namespace hashlock::escrow {

namespace {

using layout_encoder_t = encoding::layout_encoder_t;

template <typename T>
program_error load_record(const account_info& account,
                          const address_t& program_id,
                          T& out) {
  if (account.owner() != program_id || !account.holds_value()) {
    return program_error::uninitialized_account;
  }
  auto encoder = layout_encoder_t{};
  auto decoded = encoder.try_decode<T>(make_bytes_view(account.data()));
  if (!decoded) {
    return program_error::buffer_too_small;
  }
  out = *decoded;
  return program_error::success;
}

template <typename T>
program_error store_record(const account_info& account, const T& record) {
  auto encoder = layout_encoder_t{};
  if (!encoder.encode(record, mutable_bytes_view_t{account.data()})) {
    return program_error::buffer_too_small;
  }
  return program_error::success;
}

transaction_event_attribute_t attribute(std::string key, std::string value) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = true};
}

std::string_view digest_text(
    const std::array<uint8_t, kDigestTextLength>& digest) {
  return std::string_view{reinterpret_cast<const char*>(digest.data()),
                          digest.size()};
}

bool has_overflow(const lamports_t lhs, const lamports_t rhs) {
  return lhs > std::numeric_limits<lamports_t>::max() - rhs;
}

slot_t saturating_add(const slot_t slot, const uint64_t offset) {
  if (has_overflow(slot, offset)) {
    return std::numeric_limits<slot_t>::max();
  }
  return slot + offset;
}

}  // namespace

program::program(const address_t& oracle_program, const std::string_view image_id)
    : oracle_program_{oracle_program}, image_id_{image_id} {}

program_error program::process_instruction(const address_t& program_id,
                                           account_infos_t accounts,
                                           const bytes_view_t& data,
                                           invoke_context& context) {
  if (data.empty()) {
    return program_error::invalid_instruction_data;
  }
  auto payload = data.subspan(1);
  switch (static_cast<opcode>(data[0])) {
    case opcode::initialize:
      return initialize(program_id, accounts, payload, context);
    case opcode::claim:
      return claim(program_id, accounts, payload, context);
    case opcode::verify_and_release:
      return verify_and_release(program_id, accounts, payload, context);
  }
  spdlog::warn("Unknown escrow opcode {}", data[0]);
  return program_error::invalid_instruction_data;
}

program_error program::initialize(const address_t& program_id,
                                  account_infos_t accounts,
                                  const bytes_view_t& payload,
                                  invoke_context& context) {
  auto args = parse_initialize(payload);
  if (!args) {
    return program_error::invalid_input;
  }
  if (accounts.size() < 3) {
    return program_error::not_enough_account_keys;
  }
  auto& initializer = accounts[0];
  auto& escrow = accounts[1];
  if (!initializer.is_signer) {
    return program_error::missing_signature;
  }

  auto seed = make_bytes_view(args->seed);
  auto derived = escrow_address(program_id, seed);
  if (!derived || derived->address != escrow.key) {
    spdlog::warn("initialize: escrow {} does not derive from the seed",
                 to_hex(escrow.key));
    return program_error::seed_mismatch;
  }
  if (!escrow.is_writable) {
    return program_error::account_not_writable;
  }

  if (!escrow.holds_value()) {
    const auto reserve = context.rent_schedule().minimum_balance(
        kEscrowAccountSpace);
    if (has_overflow(reserve, args->amount)) {
      return program_error::invalid_input;
    }
    auto bump = std::array<uint8_t, 1>{derived->bump};
    auto create = hashlock::runtime::system::make_create_account_instruction(
        initializer.key, escrow.key, reserve + args->amount,
        kEscrowAccountSpace, program_id);
    auto created = context.invoke_signed(
        create, accounts, {{seed, bytes_view_t{bump.data(), bump.size()}}});
    if (created != program_error::success) {
      return created;
    }

    auto record = escrow_record_t{};
    std::ranges::copy(args->seed, std::begin(record.seed));
    record.amount = args->amount;
    record.committed_digest = args->committed_digest;
    record.is_claimed = false;
    record.receiver = std::nullopt;
    record.initializer = initializer.key;
    if (auto stored = store_record(escrow, record);
        stored != program_error::success) {
      return stored;
    }

    spdlog::info("Escrow {} initialized by {} with {} lamports",
                 to_hex(escrow.key), to_hex(initializer.key), args->amount);
    context.emit(make_event(
        "escrow_initialized",
        {attribute("escrow", to_hex(escrow.key)),
         attribute("initializer", to_hex(initializer.key)),
         attribute("amount", std::to_string(args->amount)),
         attribute("committed_digest",
                   std::string{digest_text(args->committed_digest)})}));
    return program_error::success;
  }

  auto record = escrow_record_t{};
  if (auto loaded = load_record(escrow, program_id, record);
      loaded != program_error::success) {
    return loaded;
  }
  if (record.is_claimed) {
    spdlog::warn("initialize: escrow {} already released", to_hex(escrow.key));
    return program_error::already_claimed;
  }
  if (record.committed_digest != args->committed_digest) {
    spdlog::warn("initialize: top-up of {} names a different digest",
                 to_hex(escrow.key));
    return program_error::invalid_input;
  }
  if (has_overflow(record.amount, args->amount)) {
    return program_error::invalid_input;
  }

  auto transfer = hashlock::runtime::system::make_transfer_instruction(
      initializer.key, escrow.key, args->amount);
  if (auto moved = context.invoke(transfer, accounts);
      moved != program_error::success) {
    return moved;
  }
  record.amount += args->amount;
  if (auto stored = store_record(escrow, record);
      stored != program_error::success) {
    return stored;
  }

  spdlog::info("Escrow {} topped up by {} lamports to {}", to_hex(escrow.key),
               args->amount, record.amount);
  context.emit(
      make_event("escrow_funded",
                 {attribute("escrow", to_hex(escrow.key)),
                  attribute("funder", to_hex(initializer.key)),
                  attribute("added", std::to_string(args->amount)),
                  attribute("amount", std::to_string(record.amount))}));
  return program_error::success;
}

program_error program::claim(const address_t& program_id,
                             account_infos_t accounts,
                             const bytes_view_t& payload,
                             invoke_context& context) {
  auto args = parse_claim(payload);
  if (!args) {
    return program_error::invalid_input;
  }
  if (accounts.size() < 9) {
    return program_error::not_enough_account_keys;
  }
  auto& payer = accounts[0];
  auto& receiver = accounts[1];
  auto& escrow = accounts[2];
  auto& tracker = accounts[3];
  auto& execution = accounts[4];
  const auto& system_program = accounts[5];
  const auto& oracle_program = accounts[6];
  const auto& deployment = accounts[7];
  const auto& self = accounts[8];
  if (!payer.is_signer) {
    return program_error::missing_signature;
  }

  auto derived_escrow = escrow_address(program_id, make_bytes_view(args->seed));
  if (!derived_escrow || derived_escrow->address != escrow.key) {
    spdlog::warn("claim: escrow {} does not derive from the seed",
                 to_hex(escrow.key));
    return program_error::address_mismatch;
  }
  if (!escrow.is_writable || !receiver.is_writable || !tracker.is_writable ||
      !execution.is_writable) {
    return program_error::account_not_writable;
  }

  auto record = escrow_record_t{};
  if (auto loaded = load_record(escrow, program_id, record);
      loaded != program_error::success) {
    return loaded;
  }
  if (record.is_claimed) {
    spdlog::warn("claim: escrow {} already released", to_hex(escrow.key));
    return program_error::already_claimed;
  }

  auto execution_id =
      bytes_view_t{args->execution_id.data(), args->execution_id.size()};
  auto derived_tracker = tracker_address(program_id, execution_id);
  if (!derived_tracker || derived_tracker->address != tracker.key ||
      derived_tracker->bump != args->bump) {
    spdlog::warn("claim: tracker {} does not derive from the execution id",
                 to_hex(tracker.key));
    return program_error::address_mismatch;
  }

  // Oracle, deployment and execution must belong to the configured oracle.
  auto derived_execution =
      hashlock::oracle::execution_address(oracle_program_, tracker.key,
                                          execution_id);
  auto derived_deployment =
      hashlock::oracle::deployment_address(oracle_program_, image_id_);
  if (oracle_program.key != oracle_program_ ||
      system_program.key != hashlock::runtime::system::kProgramId ||
      self.key != program_id || !derived_execution ||
      derived_execution->address != execution.key || !derived_deployment ||
      derived_deployment->address != deployment.key) {
    spdlog::warn("claim: oracle accounts do not match the configured oracle");
    return program_error::address_mismatch;
  }

  auto bump = std::array<uint8_t, 1>{args->bump};
  auto tracker_seeds = hashlock::runtime::signer_seeds_t{
      {execution_id, bytes_view_t{bump.data(), bump.size()}}};
  if (!tracker.holds_value()) {
    auto create = hashlock::runtime::system::make_create_account_instruction(
        payer.key, tracker.key,
        context.rent_schedule().minimum_balance(kTrackerAccountSpace),
        kTrackerAccountSpace, program_id);
    if (auto created = context.invoke_signed(create, accounts, tracker_seeds);
        created != program_error::success) {
      return created;
    }
  } else if (tracker.owner() != program_id) {
    return program_error::uninitialized_account;
  }

  auto request = execution_request_t{};
  request.image_id = image_id_;
  request.execution_id = make_bytes(execution_id);
  request.inputs = {make_url_input(make_bytes_view(args->preimage)),
                    make_private_input(make_bytes_view(kPrivateInputUrl))};
  request.tip = args->tip;
  request.expiration = saturating_add(context.slot(), args->expiry_offset);
  request.config = execution_config_t{
      .verify_input_hash = false, .input_hash = {}, .forward_output = true};
  request.callback = callback_config_t{
      .program_id = program_id,
      .instruction_prefix = {static_cast<uint8_t>(opcode::verify_and_release)},
      .extra_accounts = {make_writable_meta(tracker.key),
                         make_writable_meta(escrow.key),
                         make_writable_meta(receiver.key)}};

  auto execute = hashlock::oracle::make_execute_instruction(
      oracle_program_, tracker.key, payer.key, execution.key, deployment.key,
      request);
  if (auto requested = context.invoke_signed(execute, accounts, tracker_seeds);
      requested != program_error::success) {
    spdlog::warn("claim: oracle rejected execution request: {}",
                 to_string(requested));
    return program_error::oracle_request_rejected;
  }

  if (auto stored = store_record(
          tracker, execution_tracker_t{.execution_handle = execution.key});
      stored != program_error::success) {
    return stored;
  }

  spdlog::info("Claim on escrow {} submitted as execution {}",
               to_hex(escrow.key), to_hex(execution.key));
  spdlog::debug("claim: preimage of {} bytes, tip {}, expires at slot {}",
                args->preimage.size(), request.tip, request.expiration);
  context.emit(
      make_event("claim_requested",
                 {attribute("escrow", to_hex(escrow.key)),
                  attribute("receiver", to_hex(receiver.key)),
                  attribute("tracker", to_hex(tracker.key)),
                  attribute("execution", to_hex(execution.key)),
                  attribute("execution_id", to_hex(execution_id)),
                  attribute("expiration", std::to_string(request.expiration))}));
  return program_error::success;
}

program_error program::verify_and_release(const address_t& program_id,
                                          account_infos_t accounts,
                                          const bytes_view_t& payload,
                                          invoke_context& context) {
  if (accounts.size() < 4) {
    return program_error::not_enough_account_keys;
  }
  const auto& tracker = accounts[1];
  auto& escrow = accounts[2];
  auto& receiver = accounts[3];
  if (!escrow.is_writable || !receiver.is_writable) {
    return program_error::account_not_writable;
  }

  auto tracked = execution_tracker_t{};
  if (auto loaded = load_record(tracker, program_id, tracked);
      loaded != program_error::success) {
    return loaded;
  }

  auto error = std::string{};
  auto output = hashlock::oracle::handle_callback(
      image_id_, tracked.execution_handle, accounts, payload, error);
  if (!output) {
    spdlog::warn("verify_and_release: rejected callback: {}", error);
    return program_error::unauthorized_callback;
  }
  auto derived_tracker =
      tracker_address(program_id, make_bytes_view(output->execution_id));
  if (!derived_tracker || derived_tracker->address != tracker.key) {
    spdlog::warn("verify_and_release: callback execution id is not tracked by {}",
                 to_hex(tracker.key));
    return program_error::unauthorized_callback;
  }

  auto outputs = make_bytes_view(output->committed_outputs);
  if (outputs.empty() || !is_valid_utf8(outputs)) {
    return program_error::malformed_callback;
  }

  auto record = escrow_record_t{};
  if (auto loaded = load_record(escrow, program_id, record);
      loaded != program_error::success) {
    return loaded;
  }
  if (record.is_claimed) {
    spdlog::warn("verify_and_release: escrow {} already released",
                 to_hex(escrow.key));
    return program_error::already_claimed;
  }

  auto computed = trim_ascii_whitespace(make_string_view(outputs));
  auto committed = trim_ascii_whitespace(digest_text(record.committed_digest));
  spdlog::debug("verify_and_release: computed '{}' committed '{}'", computed,
                committed);
  if (computed != committed) {
    spdlog::warn("verify_and_release: digest mismatch for escrow {}",
                 to_hex(escrow.key));
    return program_error::hash_mismatch;
  }

  if (escrow.lamports() < record.amount ||
      has_overflow(receiver.lamports(), record.amount)) {
    return program_error::insufficient_funds;
  }
  escrow.account->lamports -= record.amount;
  receiver.account->lamports += record.amount;
  record.is_claimed = true;
  record.receiver = receiver.key;
  if (auto stored = store_record(escrow, record);
      stored != program_error::success) {
    return stored;
  }

  spdlog::info("Escrow {} released {} lamports to {}", to_hex(escrow.key),
               record.amount, to_hex(receiver.key));
  context.emit(make_event("escrow_released",
                          {attribute("escrow", to_hex(escrow.key)),
                           attribute("receiver", to_hex(receiver.key)),
                           attribute("amount", std::to_string(record.amount)),
                           attribute("execution", to_hex(tracked.execution_handle))}));
  return program_error::success;
}

}  // namespace hashlock::escrow
