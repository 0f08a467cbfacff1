#pragma once

#include <bulwark/schema/primitives.hpp>
#include <bulwark/schema/state_field.hpp>
#include <bulwark/schema/vault_state.hpp>

#include <optional>
#include <vector>

// Schema type: state mutation.
// Access workflow: The single atomic write an operation submits to the state
// authority. Rejected unless the authority is still at expected_revision.
namespace bulwark::schema {

template <uint16_t Version>
struct state_mutation;

template <>
struct state_mutation<1> final {
  uint16_t version{1};
  pubkey_t vault_id{};
  uint64_t expected_revision{};
  std::vector<field_update_t> live_updates;
  // nullopt leaves the staged queue untouched
  std::optional<pending_state_t> pending;
};

using state_mutation_t = state_mutation<1>;

}  // namespace bulwark::schema
