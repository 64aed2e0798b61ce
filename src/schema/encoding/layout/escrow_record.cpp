#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <hashlock/schema/encoding/layout/encoder.hpp>

using namespace hashlock::schema;

namespace hashlock::schema::encoding {

namespace {

inline constexpr std::size_t kSeedOffset = 0;
inline constexpr std::size_t kAmountOffset = 32;
inline constexpr std::size_t kDigestOffset = 40;
inline constexpr std::size_t kClaimedOffset = 104;
inline constexpr std::size_t kReceiverFlagOffset = 105;
inline constexpr std::size_t kReceiverOffset = 106;
inline constexpr std::size_t kInitializerOffset = 138;

static_assert(kInitializerOffset + 32 ==
              record_layout<escrow_record_t>::size);

}  // namespace

void record_layout<escrow_record_t>::write(const escrow_record_t& record,
                                           uint8_t* destination) {
  std::ranges::copy(record.seed, destination + kSeedOffset);
  boost::endian::store_little_u64(destination + kAmountOffset, record.amount);
  std::ranges::copy(record.committed_digest, destination + kDigestOffset);
  destination[kClaimedOffset] = record.is_claimed ? 1 : 0;
  if (record.receiver.has_value()) {
    destination[kReceiverFlagOffset] = 1;
    std::ranges::copy(*record.receiver, destination + kReceiverOffset);
  } else {
    destination[kReceiverFlagOffset] = 0;
    std::fill_n(destination + kReceiverOffset, address_t{}.size(), uint8_t{0});
  }
  std::ranges::copy(record.initializer, destination + kInitializerOffset);
}

escrow_record_t record_layout<escrow_record_t>::read(const uint8_t* source) {
  auto record = escrow_record_t{};
  std::copy_n(source + kSeedOffset, record.seed.size(), record.seed.begin());
  record.amount = boost::endian::load_little_u64(source + kAmountOffset);
  std::copy_n(source + kDigestOffset, record.committed_digest.size(),
              record.committed_digest.begin());
  record.is_claimed = source[kClaimedOffset] != 0;
  if (source[kReceiverFlagOffset] != 0) {
    auto receiver = address_t{};
    std::copy_n(source + kReceiverOffset, receiver.size(), receiver.begin());
    record.receiver = receiver;
  }
  std::copy_n(source + kInitializerOffset, record.initializer.size(),
              record.initializer.begin());
  return record;
}

}  // namespace hashlock::schema::encoding
