#pragma once
#include <cstddef>
#include <hashlock/common/critical.hpp>
#include <hashlock/schema/encoding/encoder.hpp>
#include <hashlock/schema/escrow_record.hpp>
#include <hashlock/schema/execution_tracker.hpp>
#include <iterator>

namespace hashlock::schema::encoding {

/// Positional, byte-exact images of program records.
///
/// Every specialization declares its fixed `size` and reads/writes exactly
/// that many bytes. Account storage is allocated from `size` plus
/// `kRecordSlack`, so the image layout is a storage contract: field order and
/// widths must never change.
template <typename T>
struct record_layout;

template <>
struct record_layout<hashlock::schema::escrow_record_t> final {
  // seed + amount + digest + claimed flag + option flag + receiver +
  // initializer
  static constexpr std::size_t size = 32 + 8 + 64 + 1 + 1 + 32 + 32;

  static void write(const hashlock::schema::escrow_record_t& record,
                    uint8_t* destination);
  static hashlock::schema::escrow_record_t read(const uint8_t* source);
};

template <>
struct record_layout<hashlock::schema::execution_tracker_t> final {
  static constexpr std::size_t size = 32;

  static void write(const hashlock::schema::execution_tracker_t& record,
                    uint8_t* destination);
  static hashlock::schema::execution_tracker_t read(const uint8_t* source);
};

inline constexpr std::size_t kRecordSlack = 100;

template <typename T>
inline constexpr std::size_t kRecordSize = record_layout<T>::size;

template <typename T>
inline constexpr std::size_t kRecordFootprint =
    record_layout<T>::size + kRecordSlack;

struct layout_encoder_tag {};

template <>
struct encoder<layout_encoder_tag> final {
  template <typename T>
  hashlock::schema::bytes_t encode(const T& obj);

  /// Write the image into the head of `out`; false when `out` is too short.
  template <typename T>
  bool encode(const T& obj, hashlock::schema::mutable_bytes_view_t out);

  template <typename T>
  T decode(const hashlock::schema::bytes_view_t& bytes);

  /// Read the image from the head of `bytes`; nullopt when too short.
  template <typename T>
  std::optional<T> try_decode(const hashlock::schema::bytes_view_t& bytes);
};

template <typename T>
hashlock::schema::bytes_t encoder<layout_encoder_tag>::encode(const T& obj) {
  auto out = hashlock::schema::bytes_t(record_layout<T>::size, 0);
  record_layout<T>::write(obj, out.data());
  return out;
}

template <typename T>
bool encoder<layout_encoder_tag>::encode(
    const T& obj,
    hashlock::schema::mutable_bytes_view_t out) {
  if (out.size() < record_layout<T>::size) {
    return false;
  }
  record_layout<T>::write(obj, out.data());
  return true;
}

template <typename T>
T encoder<layout_encoder_tag>::decode(
    const hashlock::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    hashlock::common::critical("record image shorter than its layout");
  }
  return *decoded;
}

template <typename T>
std::optional<T> encoder<layout_encoder_tag>::try_decode(
    const hashlock::schema::bytes_view_t& bytes) {
  if (bytes.size() < record_layout<T>::size) {
    return std::nullopt;
  }
  return record_layout<T>::read(bytes.data());
}

using layout_encoder_t = encoder<layout_encoder_tag>;

}  // namespace hashlock::schema::encoding
