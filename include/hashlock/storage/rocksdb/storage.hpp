#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <hashlock/common/critical.hpp>
#include <hashlock/schema/encoding/scale/encoder.hpp>
#include <hashlock/schema/key/engine_keys.hpp>
#include <hashlock/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace hashlock::storage {

namespace detail {

using encoder_t = hashlock::schema::encoding::scale_encoder_t;

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const hashlock::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline hashlock::schema::bytes_t encode_committed_state(
    const committed_state& state) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{state.slot, state.state_root});
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const hashlock::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const hashlock::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;

 private:
  void require_open() const {
    if (!database) {
      hashlock::common::critical("RocksDB database is not initialized");
    }
  }
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const hashlock::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    hashlock::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(hashlock::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const hashlock::schema::bytes_view_t& key,
    const T& value) const {
  require_open();
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key),
                              detail::to_slice(encoded_value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    hashlock::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  require_open();
  auto committed_raw = std::string{};
  auto status = database->Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      std::string{hashlock::schema::key::kCommittedSlotKey}, &committed_raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to load committed state: {}", status.ToString());
    hashlock::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, hashlock::schema::hash32_t>>(
          hashlock::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    hashlock::common::critical("failed to decode committed state");
  }
  return committed_state{.slot = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  commit({}, state);
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  require_open();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      hashlock::common::critical("failed staging key for commit");
    }
  }
  auto encoded = detail::encode_committed_state(state);
  auto state_status =
      batch.Put(std::string{hashlock::schema::key::kCommittedSlotKey},
                detail::to_slice(encoded));
  if (!state_status.ok()) {
    hashlock::common::critical("failed staging committed slot");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit batch: {}", write_status.ToString());
    hashlock::common::critical("failed to commit write batch");
  }
}

}  // namespace hashlock::storage
