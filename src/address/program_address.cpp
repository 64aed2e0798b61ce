#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <hashlock/address/program_address.hpp>
#include <hashlock/crypto/sha256.hpp>

namespace hashlock::address {

namespace {

using boost::multiprecision::cpp_int;

// edwards25519 over GF(2^255 - 19).
const cpp_int& field_prime() {
  static const auto prime = cpp_int{(cpp_int{1} << 255) - 19};
  return prime;
}

const cpp_int& curve_d() {
  // d = -121665 / 121666 mod p
  static const auto d = cpp_int{
      ((field_prime() - 121665) *
       cpp_int{boost::multiprecision::powm(cpp_int{121666}, field_prime() - 2,
                                           field_prime())}) %
      field_prime()};
  return d;
}

cpp_int load_y_coordinate(const hashlock::schema::hash32_t& point) {
  auto y = cpp_int{0};
  for (auto i = point.size(); i-- > 0;) {
    auto byte = static_cast<unsigned>(point[i]);
    if (i == point.size() - 1) {
      byte &= 0x7Fu;  // x sign bit
    }
    y <<= 8;
    y |= byte;
  }
  return y % field_prime();
}

}  // namespace

bool is_on_curve(const hashlock::schema::hash32_t& point) {
  const auto& p = field_prime();
  auto y = load_y_coordinate(point);
  auto y2 = cpp_int{(y * y) % p};
  auto u = cpp_int{(y2 + p - 1) % p};
  auto v = cpp_int{(curve_d() * y2 + 1) % p};
  if (u == 0) {
    return true;
  }
  // x^2 = u / v must be a quadratic residue (Euler's criterion).
  auto x2 = cpp_int{(u * cpp_int{boost::multiprecision::powm(v, p - 2, p)}) % p};
  return cpp_int{boost::multiprecision::powm(x2, (p - 1) / 2, p)} == 1;
}

std::optional<hashlock::schema::address_t> create_program_address(
    const seeds_t& seeds,
    const hashlock::schema::address_t& program_id) {
  if (seeds.size() > kMaxSeeds) {
    return std::nullopt;
  }
  auto parts = std::vector<hashlock::schema::bytes_view_t>{};
  parts.reserve(seeds.size() + 2);
  for (const auto& seed : seeds) {
    if (seed.size() > kMaxSeedLength) {
      return std::nullopt;
    }
    parts.push_back(seed);
  }
  parts.push_back(
      hashlock::schema::bytes_view_t{program_id.data(), program_id.size()});
  parts.push_back(hashlock::schema::make_bytes_view(kProgramDerivedMarker));

  auto candidate = hashlock::crypto::sha256(
      std::span<const hashlock::schema::bytes_view_t>{parts});
  if (is_on_curve(candidate)) {
    return std::nullopt;
  }
  return candidate;
}

std::optional<derived_address> find_program_address(
    const seeds_t& seeds,
    const hashlock::schema::address_t& program_id) {
  if (seeds.size() >= kMaxSeeds) {
    return std::nullopt;
  }
  auto bump = std::array<uint8_t, 1>{};
  auto with_bump = seeds;
  with_bump.push_back(hashlock::schema::bytes_view_t{bump.data(), bump.size()});
  for (auto candidate = 256; candidate-- > 0;) {
    bump[0] = static_cast<uint8_t>(candidate);
    if (auto address = create_program_address(with_bump, program_id)) {
      return derived_address{.address = *address, .bump = bump[0]};
    }
  }
  return std::nullopt;
}

}  // namespace hashlock::address
