#include <algorithm>
#include <array>
#include <boost/program_options.hpp>
#include <cstdint>
#include <hashlock/common/critical.hpp>
#include <hashlock/crypto/sha256.hpp>
#include <hashlock/escrow/instruction.hpp>
#include <hashlock/execution/engine.hpp>
#include <hashlock/schema/encoding/layout/encoder.hpp>
#include <hashlock/schema/encoding/scale/encoder.hpp>
#include <hashlock/schema/transaction.hpp>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = hashlock::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    hashlock::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

hashlock::schema::address_t get_address(const po::variables_map& vm,
                                        const std::string& name) {
  auto address = hashlock::schema::try_make_hash32(require(vm, name));
  if (!address) {
    hashlock::common::critical("--{} must be 64 hex characters", name);
  }
  return *address;
}

std::array<uint8_t, hashlock::escrow::kDigestTextLength> get_digest(
    const po::variables_map& vm) {
  auto text = vm.contains("digest")
                  ? vm["digest"].as<std::string>()
                  : hashlock::crypto::sha256_hex(require(vm, "preimage"));
  auto digest = std::array<uint8_t, hashlock::escrow::kDigestTextLength>{};
  if (text.size() != digest.size()) {
    hashlock::common::critical("--digest must be 64 characters of hex text");
  }
  std::copy(std::begin(text), std::end(text), std::begin(digest));
  return digest;
}

std::vector<hashlock::schema::ed25519_signature_t> get_signatures(
    const po::variables_map& vm) {
  auto signatures = std::vector<hashlock::schema::ed25519_signature_t>{};
  if (!vm.contains("signature-hex")) {
    return signatures;
  }
  for (const auto& hex : vm["signature-hex"].as<std::vector<std::string>>()) {
    auto bytes = hashlock::schema::try_from_hex(hex);
    auto signature = hashlock::schema::ed25519_signature_t{};
    if (!bytes || bytes->size() != signature.size()) {
      hashlock::common::critical("ed25519 signature must be 64 bytes of hex");
    }
    std::copy(std::begin(*bytes), std::end(*bytes), std::begin(signature));
    signatures.push_back(signature);
  }
  return signatures;
}

void emit_transaction(const po::variables_map& vm,
                      const hashlock::schema::address_t& signer,
                      hashlock::schema::instruction_t instruction) {
  auto transaction = hashlock::schema::transaction_t{
      .version = 1,
      .signers = {signer},
      .instruction = std::move(instruction),
      .signatures = get_signatures(vm)};
  if (vm.contains("signing-payload")) {
    auto payload = hashlock::execution::make_signing_payload(transaction);
    std::cout << hashlock::schema::to_hex(
                     hashlock::schema::make_bytes_view(payload))
              << '\n';
    return;
  }
  auto encoded = encoder_t{}.encode(transaction);
  std::cout << hashlock::schema::to_base64(encoded) << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder initialize [options]\n"
            << "  transaction_builder claim [options]\n"
            << "  transaction_builder derive --program-id HEX --seed TEXT\n"
            << "  transaction_builder digest --preimage TEXT\n"
            << "  transaction_builder decode-escrow --data-hex HEX\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "initialize|claim|derive|digest|decode-escrow")(
      "escrow-program-id", po::value<std::string>(),
      "escrow program address hex")("oracle-program-id",
                                    po::value<std::string>(),
                                    "oracle program address hex")(
      "program-id", po::value<std::string>(), "program address hex")(
      "initializer", po::value<std::string>(), "initializer address hex")(
      "payer", po::value<std::string>(), "claim payer address hex")(
      "receiver", po::value<std::string>(), "claim receiver address hex")(
      "seed", po::value<std::string>(), "escrow seed text (0..32 bytes)")(
      "digest", po::value<std::string>(),
      "committed digest as 64 hex characters")(
      "preimage", po::value<std::string>(), "preimage text")(
      "amount", po::value<uint64_t>()->default_value(0), "lamports to lock")(
      "execution-id", po::value<std::string>(),
      "execution id, zero-padded to 16 bytes")(
      "tip", po::value<uint64_t>()->default_value(0), "oracle tip in lamports")(
      "expiry-offset", po::value<uint64_t>()->default_value(100),
      "slots until the oracle request expires")(
      "signature-hex", po::value<std::vector<std::string>>()->multitoken(),
      "ed25519 signature hex, one per signer")(
      "signing-payload", "print the bytes to sign instead of the transaction")(
      "data-hex", po::value<std::string>(), "escrow account data hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "initialize") {
    auto initializer = get_address(vm, "initializer");
    auto args = hashlock::escrow::initialize_args{};
    args.seed = hashlock::schema::make_bytes(require(vm, "seed"));
    args.committed_digest = get_digest(vm);
    args.amount = vm["amount"].as<uint64_t>();
    emit_transaction(vm, initializer,
                     hashlock::escrow::make_initialize_instruction(
                         get_address(vm, "escrow-program-id"), initializer,
                         args));
    return 0;
  }

  if (command == "claim") {
    auto payer = get_address(vm, "payer");
    auto execution_id =
        hashlock::escrow::make_execution_id(require(vm, "execution-id"));
    if (!execution_id) {
      hashlock::common::critical("--execution-id must be at most {} bytes",
                                 hashlock::escrow::kExecutionIdLength);
    }
    auto args = hashlock::escrow::claim_args{};
    args.execution_id = *execution_id;
    args.tip = vm["tip"].as<uint64_t>();
    args.expiry_offset = vm["expiry-offset"].as<uint64_t>();
    args.seed = hashlock::schema::make_bytes(require(vm, "seed"));
    args.preimage = hashlock::schema::make_bytes(require(vm, "preimage"));
    emit_transaction(
        vm, payer,
        hashlock::escrow::make_claim_instruction(
            get_address(vm, "escrow-program-id"),
            get_address(vm, "oracle-program-id"), payer,
            get_address(vm, "receiver"), std::move(args)));
    return 0;
  }

  if (command == "derive") {
    auto seed = require(vm, "seed");
    auto derived = hashlock::escrow::escrow_address(
        get_address(vm, "program-id"), hashlock::schema::make_bytes_view(seed));
    if (!derived) {
      hashlock::common::critical("seed does not derive an address");
    }
    std::cout << hashlock::schema::to_hex(derived->address) << ' '
              << static_cast<unsigned>(derived->bump) << '\n';
    return 0;
  }

  if (command == "digest") {
    std::cout << hashlock::crypto::sha256_hex(require(vm, "preimage")) << '\n';
    return 0;
  }

  if (command == "decode-escrow") {
    auto data = hashlock::schema::try_from_hex(require(vm, "data-hex"));
    if (!data) {
      hashlock::common::critical("--data-hex is not valid hex");
    }
    auto record = hashlock::schema::encoding::layout_encoder_t{}
                      .try_decode<hashlock::schema::escrow_record_t>(
                          hashlock::schema::make_bytes_view(*data));
    if (!record) {
      hashlock::common::critical("escrow data shorter than its layout");
    }
    std::cout << "amount=" << record->amount << '\n'
              << "committed_digest="
              << std::string_view{reinterpret_cast<const char*>(
                                      record->committed_digest.data()),
                                  record->committed_digest.size()}
              << '\n'
              << "is_claimed=" << (record->is_claimed ? "true" : "false")
              << '\n'
              << "receiver="
              << (record->receiver ? hashlock::schema::to_hex(*record->receiver)
                                   : std::string{"none"})
              << '\n'
              << "initializer=" << hashlock::schema::to_hex(record->initializer)
              << '\n';
    return 0;
  }

  hashlock::common::critical(
      "command must be initialize|claim|derive|digest|decode-escrow");
}
