#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/status.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <bulwark/common/critical.hpp>
#include <bulwark/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace bulwark::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice as_slice(
    const bulwark::schema::bytes_view_t& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline bulwark::schema::bytes_t as_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  auto begin = reinterpret_cast<const uint8_t*>(slice.data());
  return {begin, begin + slice.size()};
}

/// Smallest key greater than every key starting with prefix; empty when the
/// prefix is all 0xff and no such bound exists.
inline std::string prefix_upper_bound(
    const bulwark::schema::bytes_view_t& prefix) {
  auto bound = std::string{reinterpret_cast<const char*>(prefix.data()),
                           prefix.size()};
  while (!bound.empty()) {
    auto& last = reinterpret_cast<unsigned char&>(bound.back());
    if (last != 0xff) {
      ++last;
      return bound;
    }
    bound.pop_back();
  }
  return bound;
}

inline void check(const ROCKSDB_NAMESPACE::Status& status,
                  const std::string_view operation) {
  if (status.ok()) {
    return;
  }
  bulwark::common::critical("RocksDB {} failed: {}", operation,
                            status.ToString());
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const bulwark::schema::bytes_view_t& key);

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const bulwark::schema::bytes_view_t& key,
           const T& value);

  bool contains(const bulwark::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const bulwark::schema::bytes_view_t& prefix) const;
  void write_batch(const std::vector<key_value_entry_t>& entries) const;

 private:
  ROCKSDB_NAMESPACE::DB& open_database() const {
    if (!database) {
      bulwark::common::critical("vault storage used before it was opened");
    }
    return *database;
  }
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const bulwark::schema::bytes_view_t& key) {
  auto value = ROCKSDB_NAMESPACE::PinnableSlice{};
  auto status = open_database().Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      open_database().DefaultColumnFamily(), detail::as_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  detail::check(status, "get");
  return encoder.template decode<T>(bulwark::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const bulwark::schema::bytes_view_t& key,
                                       const T& value) {
  auto encoded = encoder.encode(value);
  write_batch({{bulwark::schema::bytes_t{std::begin(key), std::end(key)},
                std::move(encoded)}});
}

inline bool storage<rocksdb_storage_tag>::contains(
    const bulwark::schema::bytes_view_t& key) const {
  auto value = ROCKSDB_NAMESPACE::PinnableSlice{};
  auto status = open_database().Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      open_database().DefaultColumnFamily(), detail::as_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  detail::check(status, "lookup");
  return true;
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const bulwark::schema::bytes_view_t& prefix) const {
  // the bound slice must outlive the iterator
  auto bound = detail::prefix_upper_bound(prefix);
  auto bound_slice = ROCKSDB_NAMESPACE::Slice{bound};
  auto options = ROCKSDB_NAMESPACE::ReadOptions{};
  if (!bound.empty()) {
    options.iterate_upper_bound = &bound_slice;
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      open_database().NewIterator(options)};
  for (iterator->Seek(detail::as_slice(prefix)); iterator->Valid();
       iterator->Next()) {
    if (!iterator->key().starts_with(detail::as_slice(prefix))) {
      break;
    }
    entries.emplace_back(detail::as_bytes(iterator->key()),
                         detail::as_bytes(iterator->value()));
  }
  detail::check(iterator->status(), "prefix scan");
  return entries;
}

inline void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& entries) const {
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    detail::check(batch.Put(detail::as_slice(key), detail::as_slice(value)),
                  "batch staging");
  }
  // durable before the caller sees a transaction id
  auto options = ROCKSDB_NAMESPACE::WriteOptions{};
  options.sync = true;
  detail::check(open_database().Write(options, &batch), "batch commit");
}

}  // namespace bulwark::storage
