#pragma once
#include <bulwark/policy/registry.hpp>
#include <bulwark/schema/delegate_acl.hpp>
#include <bulwark/schema/integration_acl.hpp>
#include <bulwark/schema/primitives.hpp>
#include <bulwark/schema/state_field.hpp>
#include <bulwark/schema/vault_state.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Live vs staged comparison of one field. Entities are matched by identity
// (program, delegate key, asset key), never by position, so reordering a
// list is not a change.
namespace bulwark::timelock {

/// Principals entering and leaving one allowlist of a policy, rendered the
/// way the policy view prints them.
struct allowlist_change_t final {
  std::string title;
  std::vector<std::string> added;
  std::vector<std::string> removed;
};

struct slippage_change_t final {
  uint16_t before{};
  uint16_t after{};
};

/// A missing side means the policy is being set or removed. Both detail
/// fields stay empty for protocols whose payload cannot be decoded; the
/// bytes are then the only comparison.
struct policy_change_t final {
  bulwark::schema::protocol_bitflag_t protocol_bitflag{};
  std::optional<bulwark::schema::bytes_t> before;
  std::optional<bulwark::schema::bytes_t> after;
  std::vector<allowlist_change_t> allowlist_changes;
  std::optional<slippage_change_t> slippage;
};

struct integration_change_t final {
  bulwark::schema::integration_program_t integration_program{};
  bulwark::schema::protocols_bitmask_t enabled_protocols{};
  bulwark::schema::protocols_bitmask_t disabled_protocols{};
  std::vector<policy_change_t> policy_changes;
};

struct integration_acls_diff_t final {
  std::vector<bulwark::schema::integration_acl_t> added;
  std::vector<bulwark::schema::integration_acl_t> removed;
  std::vector<integration_change_t> modified;
};

struct permission_change_t final {
  bulwark::schema::integration_program_t integration_program{};
  bulwark::schema::protocol_bitflag_t protocol_bitflag{};
  bulwark::schema::permissions_bitmask_t added{};
  bulwark::schema::permissions_bitmask_t removed{};
};

struct delegate_change_t final {
  bulwark::schema::pubkey_t pubkey{};
  bulwark::schema::timestamp_seconds_t current_expires_at{};
  bulwark::schema::timestamp_seconds_t staged_expires_at{};
  std::vector<permission_change_t> permission_changes;
};

struct delegate_acls_diff_t final {
  std::vector<bulwark::schema::delegate_acl_t> added;
  std::vector<bulwark::schema::delegate_acl_t> removed;
  std::vector<delegate_change_t> modified;
};

struct pubkey_set_diff_t final {
  std::vector<bulwark::schema::pubkey_t> added;
  std::vector<bulwark::schema::pubkey_t> removed;
};

struct duration_diff_t final {
  bulwark::schema::duration_seconds_t current{};
  bulwark::schema::duration_seconds_t staged{};
  bool changed{};
};

using field_diff_t = std::variant<integration_acls_diff_t,
                                  delegate_acls_diff_t,
                                  pubkey_set_diff_t,
                                  duration_diff_t>;

/// Policies of registered protocols are compared by allowlist membership, so
/// reordering entries is not a change.
integration_acls_diff_t diff_integration_acls(
    const std::vector<bulwark::schema::integration_acl_t>& current,
    const std::vector<bulwark::schema::integration_acl_t>& staged,
    const bulwark::policy::registry& protocols);

delegate_acls_diff_t diff_delegate_acls(
    const std::vector<bulwark::schema::delegate_acl_t>& current,
    const std::vector<bulwark::schema::delegate_acl_t>& staged);

pubkey_set_diff_t diff_pubkeys(
    const std::vector<bulwark::schema::pubkey_t>& current,
    const std::vector<bulwark::schema::pubkey_t>& staged);

/// Empty diff of the field's kind when nothing is staged for it.
field_diff_t diff(const bulwark::schema::vault_state_t& state,
                  bulwark::schema::state_field_t field,
                  const bulwark::policy::registry& protocols);

bool is_empty(const field_diff_t& diff);

/// Indented listing of a field diff, protocol and permission bits resolved
/// through `protocols`.
std::vector<std::string> render(bulwark::schema::state_field_t field,
                                const field_diff_t& diff,
                                const bulwark::policy::registry& protocols);

}  // namespace bulwark::timelock
