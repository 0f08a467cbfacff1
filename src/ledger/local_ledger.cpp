#include <bulwark/blake3/hash.hpp>
#include <bulwark/ledger/local_ledger.hpp>
#include <bulwark/schema/key/vault_state.hpp>
#include <bulwark/timelock/engine.hpp>

#include <spdlog/spdlog.h>

namespace bulwark::ledger {

namespace {

constexpr auto kCodespace = "bulwark.ledger";

}  // namespace

local_ledger::local_ledger(const std::string_view& db_path)
    : storage_{bulwark::storage::make_storage<
          bulwark::storage::rocksdb_storage_tag>(db_path)} {}

bulwark::schema::operation_result_t local_ledger::create_vault(
    const bulwark::schema::pubkey_t& vault_id) {
  auto lock = std::scoped_lock{mutex_};
  if (storage_.contains(
          bulwark::schema::key::make_vault_state_key(encoder_, vault_id))) {
    return bulwark::schema::make_error(
        bulwark::schema::policy_error_code::vault_exists, "vault exists",
        bulwark::schema::to_base58(vault_id), kCodespace);
  }
  auto state = bulwark::schema::vault_state_t{};
  state.vault_id = vault_id;
  auto key = bulwark::schema::key::make_key(encoder_, state);
  storage_.put(encoder_, key, state);
  spdlog::info("Created vault {}", bulwark::schema::to_base58(vault_id));
  return {};
}

std::optional<bulwark::schema::vault_state_t> local_ledger::fetch_live_state(
    const bulwark::schema::pubkey_t& vault_id) {
  auto lock = std::scoped_lock{mutex_};
  return load(vault_id);
}

bulwark::schema::operation_result_t local_ledger::submit_mutation(
    const bulwark::schema::state_mutation_t& mutation) {
  auto lock = std::scoped_lock{mutex_};
  auto state = load(mutation.vault_id);
  if (!state) {
    return bulwark::schema::make_error(
        bulwark::schema::policy_error_code::vault_missing, "vault not found",
        bulwark::schema::to_base58(mutation.vault_id), kCodespace);
  }
  if (state->revision != mutation.expected_revision) {
    spdlog::warn("Rejected mutation for {}: expected revision {}, at {}",
                 bulwark::schema::short_key(mutation.vault_id),
                 mutation.expected_revision, state->revision);
    return bulwark::schema::make_error(
        bulwark::schema::policy_error_code::precondition_mismatch,
        "vault state changed since it was read",
        "expected revision " + std::to_string(mutation.expected_revision) +
            ", current revision " + std::to_string(state->revision),
        kCodespace);
  }

  bulwark::timelock::apply_mutation(*state, mutation);
  ++state->revision;

  auto encoded_mutation = encoder_.encode(mutation);
  auto transaction_id = bulwark::blake3::hash(
      bulwark::schema::bytes_view_t{encoded_mutation});
  storage_.write_batch(
      {{bulwark::schema::key::make_key(encoder_, *state),
        encoder_.encode(*state)},
       {bulwark::schema::key::make_vault_log_key(encoder_, state->vault_id,
                                                 state->revision),
        std::move(encoded_mutation)}});

  spdlog::debug("Accepted mutation for {} at revision {} ({} live, pending {})",
                bulwark::schema::short_key(mutation.vault_id), state->revision,
                mutation.live_updates.size(),
                mutation.pending ? "replaced" : "kept");

  auto result = bulwark::schema::operation_result_t{};
  result.transaction_id = transaction_id;
  return result;
}

std::vector<bulwark::schema::state_mutation_t> local_ledger::mutation_log(
    const bulwark::schema::pubkey_t& vault_id) {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = bulwark::schema::key::make_vault_log_prefix(encoder_, vault_id);
  auto log = std::vector<bulwark::schema::state_mutation_t>{};
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    log.push_back(
        encoder_.decode<bulwark::schema::state_mutation_t>(value));
  }
  return log;
}

std::optional<bulwark::schema::vault_state_t> local_ledger::load(
    const bulwark::schema::pubkey_t& vault_id) {
  auto key = bulwark::schema::key::make_vault_state_key(encoder_, vault_id);
  return storage_.get<bulwark::schema::encoding::scale_encoder_t,
                      bulwark::schema::vault_state_t>(encoder_, key);
}

}  // namespace bulwark::ledger
