#pragma once

#include <bulwark/schema/delegate_acl.hpp>
#include <bulwark/schema/integration_acl.hpp>
#include <bulwark/schema/primitives.hpp>
#include <bulwark/schema/state_field.hpp>

#include <optional>
#include <vector>

// Schema type: vault state.
// Access workflow: Live access-control configuration of one vault plus the
// queue of staged replacements waiting behind the timelock.
namespace bulwark::schema {

template <uint16_t Version>
struct pending_state;

template <>
struct pending_state<1> final {
  uint16_t version{1};
  timestamp_seconds_t expires_at{};  // 0 when nothing is staged
  // at most one update per state_field_t, ordered by field
  std::vector<field_update_t> updates;

  bool operator==(const pending_state&) const = default;
};

using pending_state_t = pending_state<1>;

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  uint16_t version{1};
  pubkey_t vault_id{};
  uint64_t revision{};
  std::vector<integration_acl_t> integration_acls;
  std::vector<delegate_acl_t> delegate_acls;
  std::vector<pubkey_t> assets;
  std::vector<pubkey_t> borrowable;
  duration_seconds_t timelock_duration{};
  pending_state_t pending;
};

using vault_state_t = vault_state<1>;

}  // namespace bulwark::schema
