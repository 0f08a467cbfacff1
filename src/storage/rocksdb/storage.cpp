#include <bulwark/storage/rocksdb/storage.hpp>

#include <string>

namespace bulwark::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.max_open_files = 64;
  options.keep_log_file_num = 4;

  ROCKSDB_NAMESPACE::DB* raw{nullptr};
  detail::check(ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &raw),
                "open");
  spdlog::debug("Vault storage opened at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(raw);
  return store;
}

}  // namespace bulwark::storage
