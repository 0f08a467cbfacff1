#pragma once

#include <bulwark/ledger/state_store.hpp>
#include <bulwark/schema/operation_result.hpp>
#include <bulwark/schema/policy_error_code.hpp>
#include <bulwark/schema/vault_state.hpp>
#include <bulwark/timelock/engine.hpp>
#include <bulwark/testing/common.hpp>

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bulwark::testing {

/// In-memory state authority with scripted rejections. Mutations are checked
/// against the vault revision exactly like the RocksDB ledger.
class memory_ledger final : public bulwark::ledger::state_reader,
                            public bulwark::ledger::state_mutator {
 public:
  bulwark::schema::vault_state_t& create_vault(
      const bulwark::schema::pubkey_t& vault_id) {
    auto state = bulwark::schema::vault_state_t{};
    state.vault_id = vault_id;
    return states_[vault_id] = state;
  }

  bulwark::schema::vault_state_t& state(
      const bulwark::schema::pubkey_t& vault_id) {
    return states_.at(vault_id);
  }

  std::optional<bulwark::schema::vault_state_t> fetch_live_state(
      const bulwark::schema::pubkey_t& vault_id) override {
    ++fetches_;
    auto it = states_.find(vault_id);
    if (it == states_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bulwark::schema::operation_result_t submit_mutation(
      const bulwark::schema::state_mutation_t& mutation) override {
    submitted_.push_back(mutation);
    if (!scripted_.empty()) {
      auto result = scripted_.front();
      scripted_.pop_front();
      return result;
    }
    auto it = states_.find(mutation.vault_id);
    if (it == states_.end()) {
      return bulwark::schema::make_error(
          bulwark::schema::policy_error_code::vault_missing, "vault not found",
          {}, "memory");
    }
    if (it->second.revision != mutation.expected_revision) {
      return bulwark::schema::make_error(
          bulwark::schema::policy_error_code::precondition_mismatch,
          "stale revision", {}, "memory");
    }
    bulwark::timelock::apply_mutation(it->second, mutation);
    ++it->second.revision;
    auto result = bulwark::schema::operation_result_t{};
    result.transaction_id = make_hash(static_cast<uint8_t>(submitted_.size()));
    return result;
  }

  /// Next submissions return `result` verbatim, `times` times, before the
  /// ledger goes back to applying mutations.
  void script(const bulwark::schema::operation_result_t& result,
              const std::size_t times = 1) {
    for (auto i = std::size_t{0}; i < times; ++i) {
      scripted_.push_back(result);
    }
  }

  const std::vector<bulwark::schema::state_mutation_t>& submitted() const {
    return submitted_;
  }

  std::size_t fetches() const { return fetches_; }

 private:
  std::map<bulwark::schema::pubkey_t, bulwark::schema::vault_state_t> states_;
  std::deque<bulwark::schema::operation_result_t> scripted_;
  std::vector<bulwark::schema::state_mutation_t> submitted_;
  std::size_t fetches_{};
};

}  // namespace bulwark::testing
