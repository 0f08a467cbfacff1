#pragma once
#include <bulwark/schema/operation_result.hpp>
#include <bulwark/schema/primitives.hpp>
#include <bulwark/schema/state_mutation.hpp>
#include <bulwark/schema/vault_state.hpp>

#include <optional>

// Boundary to the authority that owns vault state. The engine reads a full
// snapshot, computes the next one locally and hands back a single mutation.
namespace bulwark::ledger {

class state_reader {
 public:
  virtual ~state_reader() = default;

  /// Current live state plus staged queue, or std::nullopt for an unknown
  /// vault.
  virtual std::optional<bulwark::schema::vault_state_t> fetch_live_state(
      const bulwark::schema::pubkey_t& vault_id) = 0;
};

class state_mutator {
 public:
  virtual ~state_mutator() = default;

  /// Apply the mutation atomically. Success carries the transaction id; a
  /// stale expected_revision yields policy_error_code::precondition_mismatch.
  virtual bulwark::schema::operation_result_t submit_mutation(
      const bulwark::schema::state_mutation_t& mutation) = 0;
};

}  // namespace bulwark::ledger
