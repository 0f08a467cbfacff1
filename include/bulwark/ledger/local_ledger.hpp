#pragma once
#include <bulwark/ledger/state_store.hpp>
#include <bulwark/schema/encoding/scale/encoder.hpp>
#include <bulwark/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace bulwark::ledger {

/// RocksDB backed state authority. Each accepted mutation bumps the vault
/// revision and is appended to the vault's mutation log in the same batch.
class local_ledger final : public state_reader, public state_mutator {
 public:
  explicit local_ledger(const std::string_view& db_path);

  /// Store an empty state for `vault_id` (revision 0).
  bulwark::schema::operation_result_t create_vault(
      const bulwark::schema::pubkey_t& vault_id);

  std::optional<bulwark::schema::vault_state_t> fetch_live_state(
      const bulwark::schema::pubkey_t& vault_id) override;

  bulwark::schema::operation_result_t submit_mutation(
      const bulwark::schema::state_mutation_t& mutation) override;

  /// Accepted mutations of one vault, oldest first.
  std::vector<bulwark::schema::state_mutation_t> mutation_log(
      const bulwark::schema::pubkey_t& vault_id);

 private:
  std::optional<bulwark::schema::vault_state_t> load(
      const bulwark::schema::pubkey_t& vault_id);

  std::mutex mutex_;
  bulwark::schema::encoding::scale_encoder_t encoder_;
  bulwark::storage::rocksdb_storage_t storage_;
};

}  // namespace bulwark::ledger
