#pragma once
#include <hashlock/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace hashlock::storage {

using key_value_entry_t =
    std::pair<hashlock::schema::bytes_t, hashlock::schema::bytes_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  hashlock::schema::slot_t slot{};
  hashlock::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const hashlock::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const hashlock::schema::bytes_view_t& key,
           const T& value) const;

  /// Load the most recent committed checkpoint (slot + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (slot + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Atomically write `entries` together with the new checkpoint.
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace hashlock::storage
