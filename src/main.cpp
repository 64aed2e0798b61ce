#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <boost/program_options.hpp>
#include <csignal>
#include <fstream>
#include <hashlock/common/critical.hpp>
#include <hashlock/escrow/program.hpp>
#include <hashlock/execution/engine.hpp>
#include <hashlock/schema/primitives.hpp>
#include <hashlock/storage/rocksdb/storage.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

hashlock::schema::address_t parse_address(const std::string& hex,
                                          const std::string_view option) {
  auto address = hashlock::schema::try_make_hash32(hex);
  if (!address) {
    hashlock::common::critical("--{} must be 64 hex characters", option);
  }
  return *address;
}

// ADDRESS:LAMPORTS
std::pair<hashlock::schema::address_t, hashlock::schema::lamports_t>
parse_airdrop(const std::string& value) {
  auto colon = value.find(':');
  if (colon == std::string::npos) {
    hashlock::common::critical("--airdrop expects ADDRESS:LAMPORTS, got '{}'",
                               value);
  }
  auto address = parse_address(value.substr(0, colon), "airdrop");
  try {
    return {address, std::stoull(value.substr(colon + 1))};
  } catch (const std::exception& ex) {
    hashlock::common::critical("--airdrop has an invalid amount: {}",
                               ex.what());
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto db_path = std::string{};
  auto escrow_program_id = std::string{};
  auto oracle_program_id = std::string{};
  auto input_path = std::string{};
  auto log_file = std::string{};
  auto start_slot = uint64_t{};
  auto strict_crypto = true;
  auto airdrops = std::vector<std::string>{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"hashlock"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "hashlock.db"),
      "RocksDB directory for ledger state")(
      "escrow-program-id",
      boost::program_options::value<std::string>(&escrow_program_id)
          ->required(),
      "address (hex) the escrow program is hosted at")(
      "oracle-program-id",
      boost::program_options::value<std::string>(&oracle_program_id)
          ->required(),
      "address (hex) of the trusted oracle program")(
      "strict-crypto",
      boost::program_options::value<bool>(&strict_crypto)->default_value(true),
      "verify Ed25519 transaction signatures")(
      "start-slot",
      boost::program_options::value<uint64_t>(&start_slot)->default_value(1),
      "slot assigned to the first transaction")(
      "input,i",
      boost::program_options::value<std::string>(&input_path)
          ->default_value("-"),
      "file of base64 transactions, one per line ('-' for stdin)")(
      "airdrop",
      boost::program_options::value<std::vector<std::string>>(&airdrops)
          ->multitoken(),
      "genesis funding as ADDRESS:LAMPORTS")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "hashlock.log"),
      "log file path")("verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return 0;
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "hashlock", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto escrow_id = parse_address(escrow_program_id, "escrow-program-id");
  auto oracle_id = parse_address(oracle_program_id, "oracle-program-id");

  auto encoder = hashlock::schema::encoding::scale_encoder_t{};
  auto storage = hashlock::storage::make_storage<
      hashlock::storage::rocksdb_storage_tag>(db_path);
  auto engine =
      hashlock::execution::engine{encoder, storage, strict_crypto};
  engine.register_program(
      escrow_id, std::make_shared<hashlock::escrow::program>(oracle_id),
      "escrow");

  if (!airdrops.empty()) {
    for (const auto& airdrop : airdrops) {
      auto [address, lamports] = parse_airdrop(airdrop);
      engine.airdrop(address, lamports);
    }
    engine.commit();
  }

  auto file = std::ifstream{};
  if (input_path != "-") {
    file.open(input_path);
    if (!file) {
      hashlock::common::critical("cannot open input file {}", input_path);
    }
  }
  auto& input = input_path == "-" ? std::cin : static_cast<std::istream&>(file);

  auto slot = std::max<uint64_t>(start_slot, engine.info().last_committed_slot + 1);
  auto line = std::string{};
  while (!shutdown_requested() && std::getline(input, line)) {
    auto trimmed = hashlock::schema::trim_ascii_whitespace(line);
    if (trimmed.empty() || trimmed.starts_with('#')) {
      continue;
    }
    auto raw = hashlock::schema::try_from_base64(trimmed);
    if (!raw) {
      spdlog::warn("Skipping line that is not base64");
      continue;
    }
    auto block = engine.finalize_block(slot, {*raw});
    auto committed = engine.commit();
    const auto& result = block.tx_results.front();
    std::cout << "slot=" << committed.committed_slot << " code=" << result.code
              << " codespace=" << result.codespace << " log=" << result.log
              << " events=" << result.events.size()
              << " root=" << hashlock::schema::to_hex(committed.state_root)
              << std::endl;
    ++slot;
  }

  spdlog::info("Stopped at slot {}", engine.info().last_committed_slot);
  spdlog::shutdown();
  return 0;
}
