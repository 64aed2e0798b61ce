#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <hashlock/escrow/instruction.hpp>
#include <hashlock/oracle/client.hpp>
#include <hashlock/runtime/system_program.hpp>
#include <iterator>

using namespace hashlock::schema;

namespace hashlock::escrow {

namespace {

struct reader final {
  bytes_view_t input;
  std::size_t offset{};

  std::optional<bytes_view_t> take(const std::size_t count) {
    if (input.size() - offset < count) {
      return std::nullopt;
    }
    auto out = input.subspan(offset, count);
    offset += count;
    return out;
  }

  std::optional<uint8_t> u8() {
    auto bytes = take(1);
    if (!bytes) {
      return std::nullopt;
    }
    return (*bytes)[0];
  }

  std::optional<uint16_t> u16() {
    auto bytes = take(2);
    if (!bytes) {
      return std::nullopt;
    }
    return boost::endian::load_little_u16(bytes->data());
  }

  std::optional<uint64_t> u64() {
    auto bytes = take(8);
    if (!bytes) {
      return std::nullopt;
    }
    return boost::endian::load_little_u64(bytes->data());
  }
};

void append_u16(bytes_t& out, const uint16_t value) {
  auto offset = out.size();
  out.resize(offset + sizeof(uint16_t));
  boost::endian::store_little_u16(out.data() + offset, value);
}

void append_u64(bytes_t& out, const uint64_t value) {
  auto offset = out.size();
  out.resize(offset + sizeof(uint64_t));
  boost::endian::store_little_u64(out.data() + offset, value);
}

}  // namespace

std::optional<execution_id_t> make_execution_id(const std::string_view id) {
  if (id.size() > kExecutionIdLength) {
    return std::nullopt;
  }
  auto out = execution_id_t{};
  std::ranges::copy(id, std::begin(out));
  return out;
}

std::optional<initialize_args> parse_initialize(const bytes_view_t& payload) {
  auto in = reader{.input = payload};
  auto seed_len = in.u8();
  if (!seed_len || *seed_len > kMaxSeedLength) {
    return std::nullopt;
  }
  auto seed = in.take(*seed_len);
  auto hash_len = in.u8();
  if (!seed || !hash_len || *hash_len != kDigestTextLength) {
    return std::nullopt;
  }
  auto hash = in.take(*hash_len);
  auto amount = in.u64();
  if (!hash || !amount) {
    return std::nullopt;
  }

  auto args = initialize_args{};
  args.seed = make_bytes(*seed);
  std::ranges::copy(*hash, std::begin(args.committed_digest));
  args.amount = *amount;
  return args;
}

std::optional<claim_args> parse_claim(const bytes_view_t& payload) {
  auto in = reader{.input = payload};
  auto execution_id = in.take(kExecutionIdLength);
  if (!execution_id || !is_valid_utf8(*execution_id)) {
    return std::nullopt;
  }
  auto bump = in.u8();
  auto tip = in.u64();
  auto expiry_offset = in.u64();
  auto seed_len = in.u8();
  if (!bump || !tip || !expiry_offset || !seed_len ||
      *seed_len > kMaxSeedLength) {
    return std::nullopt;
  }
  auto seed = in.take(*seed_len);
  auto preimage_len = in.u16();
  if (!seed || !preimage_len || *preimage_len > kMaxPreimageLength) {
    return std::nullopt;
  }
  auto preimage = in.take(*preimage_len);
  if (!preimage) {
    return std::nullopt;
  }

  auto args = claim_args{};
  std::ranges::copy(*execution_id, std::begin(args.execution_id));
  args.bump = *bump;
  args.tip = *tip;
  args.expiry_offset = *expiry_offset;
  args.seed = make_bytes(*seed);
  args.preimage = make_bytes(*preimage);
  return args;
}

bytes_t encode_initialize(const initialize_args& args) {
  auto out = bytes_t{static_cast<uint8_t>(opcode::initialize)};
  out.push_back(static_cast<uint8_t>(args.seed.size()));
  out.insert(std::end(out), std::begin(args.seed), std::end(args.seed));
  out.push_back(static_cast<uint8_t>(args.committed_digest.size()));
  out.insert(std::end(out), std::begin(args.committed_digest),
             std::end(args.committed_digest));
  append_u64(out, args.amount);
  return out;
}

bytes_t encode_claim(const claim_args& args) {
  auto out = bytes_t{static_cast<uint8_t>(opcode::claim)};
  out.insert(std::end(out), std::begin(args.execution_id),
             std::end(args.execution_id));
  out.push_back(args.bump);
  append_u64(out, args.tip);
  append_u64(out, args.expiry_offset);
  out.push_back(static_cast<uint8_t>(args.seed.size()));
  out.insert(std::end(out), std::begin(args.seed), std::end(args.seed));
  append_u16(out, static_cast<uint16_t>(args.preimage.size()));
  out.insert(std::end(out), std::begin(args.preimage), std::end(args.preimage));
  return out;
}

std::optional<hashlock::address::derived_address> escrow_address(
    const address_t& escrow_program,
    const bytes_view_t& seed) {
  return hashlock::address::find_program_address({seed}, escrow_program);
}

std::optional<hashlock::address::derived_address> tracker_address(
    const address_t& escrow_program,
    const bytes_view_t& execution_id) {
  return hashlock::address::find_program_address({execution_id},
                                                 escrow_program);
}

instruction_t make_initialize_instruction(const address_t& escrow_program,
                                          const address_t& initializer,
                                          const initialize_args& args) {
  auto escrow = escrow_address(escrow_program, make_bytes_view(args.seed));
  auto ix = instruction_t{};
  ix.program_id = escrow_program;
  ix.accounts = {
      make_writable_meta(initializer, true),
      make_writable_meta(escrow ? escrow->address : address_t{}),
      make_readonly_meta(hashlock::runtime::system::kProgramId)};
  ix.data = encode_initialize(args);
  return ix;
}

instruction_t make_claim_instruction(const address_t& escrow_program,
                                     const address_t& oracle_program,
                                     const address_t& payer,
                                     const address_t& receiver,
                                     claim_args args) {
  auto execution_id =
      bytes_view_t{args.execution_id.data(), args.execution_id.size()};
  auto escrow = escrow_address(escrow_program, make_bytes_view(args.seed));
  auto tracker = tracker_address(escrow_program, execution_id);
  auto tracker_key = tracker ? tracker->address : address_t{};
  if (tracker) {
    args.bump = tracker->bump;
  }
  auto execution =
      hashlock::oracle::execution_address(oracle_program, tracker_key,
                                          execution_id);
  auto deployment =
      hashlock::oracle::deployment_address(oracle_program, kSha256ImageId);

  auto ix = instruction_t{};
  ix.program_id = escrow_program;
  ix.accounts = {
      make_writable_meta(payer, true),
      make_writable_meta(receiver),
      make_writable_meta(escrow ? escrow->address : address_t{}),
      make_writable_meta(tracker_key),
      make_writable_meta(execution ? execution->address : address_t{}),
      make_readonly_meta(hashlock::runtime::system::kProgramId),
      make_readonly_meta(oracle_program),
      make_readonly_meta(deployment ? deployment->address : address_t{}),
      make_readonly_meta(escrow_program)};
  ix.data = encode_claim(args);
  return ix;
}

}  // namespace hashlock::escrow
