#pragma once
#include <bulwark/schema/primitives.hpp>

#include <vector>

// Schema type: delegate acl.
// Access workflow: Capabilities a non-owner key holds on the vault, nested as
// integration -> protocol -> permission bitmask, optionally time bounded.
namespace bulwark::schema {

template <uint16_t Version>
struct protocol_permissions;

template <>
struct protocol_permissions<1> final {
  uint16_t version{1};
  protocol_bitflag_t protocol_bitflag{};
  permissions_bitmask_t permissions_bitmask{};

  bool operator==(const protocol_permissions&) const = default;
};

using protocol_permissions_t = protocol_permissions<1>;

template <uint16_t Version>
struct integration_permissions;

template <>
struct integration_permissions<1> final {
  uint16_t version{1};
  integration_program_t integration_program{};
  std::vector<protocol_permissions_t> protocol_permissions;

  bool operator==(const integration_permissions&) const = default;
};

using integration_permissions_t = integration_permissions<1>;

template <uint16_t Version>
struct delegate_acl;

template <>
struct delegate_acl<1> final {
  uint16_t version{1};
  pubkey_t pubkey{};
  timestamp_seconds_t expires_at{};  // 0 never expires
  std::vector<integration_permissions_t> integration_permissions;

  bool operator==(const delegate_acl&) const = default;
};

using delegate_acl_t = delegate_acl<1>;

}  // namespace bulwark::schema
