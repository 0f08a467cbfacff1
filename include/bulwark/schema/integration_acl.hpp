#pragma once
#include <bulwark/schema/primitives.hpp>

#include <vector>

// Schema type: integration acl.
// Access workflow: One external integration program enabled for a vault, the
// protocols switched on within it, and the encoded per-protocol policies.
namespace bulwark::schema {

template <uint16_t Version>
struct protocol_policy;

template <>
struct protocol_policy<1> final {
  uint16_t version{1};
  protocol_bitflag_t protocol_bitflag{};
  bytes_t data;

  bool operator==(const protocol_policy&) const = default;
};

using protocol_policy_t = protocol_policy<1>;

template <uint16_t Version>
struct integration_acl;

template <>
struct integration_acl<1> final {
  uint16_t version{1};
  integration_program_t integration_program{};
  protocols_bitmask_t protocols_bitmask{};
  // at most one entry per protocol_bitflag; an entry may outlive its bit
  // being cleared (dormant policy)
  std::vector<protocol_policy_t> protocol_policies;

  bool operator==(const integration_acl&) const = default;
};

using integration_acl_t = integration_acl<1>;

}  // namespace bulwark::schema
