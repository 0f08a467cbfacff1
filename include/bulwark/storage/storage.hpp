#pragma once
#include <bulwark/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace bulwark::storage {

/// Raw key and already-encoded value, as written by `write_batch`.
using key_value_entry_t =
    std::pair<bulwark::schema::bytes_t, bulwark::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode the record stored at key; std::nullopt when the key is absent.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const bulwark::schema::bytes_view_t& key);

  /// Encode and store one record.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const bulwark::schema::bytes_view_t& key,
           const T& value);

  bool contains(const bulwark::schema::bytes_view_t& key) const;

  /// Entries under prefix in ascending key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const bulwark::schema::bytes_view_t& prefix) const;

  /// All entries become visible together or not at all.
  void write_batch(const std::vector<key_value_entry_t>& entries) const;
};

template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace bulwark::storage
