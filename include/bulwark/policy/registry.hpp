#pragma once
#include <bulwark/policy/allowlist.hpp>
#include <bulwark/policy/protocol_policies.hpp>
#include <bulwark/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bulwark::policy {

struct permission_descriptor_t final {
  uint8_t bit{};
  std::string_view name;
};

struct protocol_descriptor_t final {
  std::string_view integration;
  bulwark::schema::integration_program_t integration_program{};
  std::string_view name;
  bulwark::schema::protocol_bitflag_t bitflag{};
  std::vector<permission_descriptor_t> permissions;
  policy_schema_t schema{policy_schema_t::none};
  // also applies when no policy was ever written for the protocol
  empty_allowlist_t empty_allowlist{empty_allowlist_t::unrestricted};

  std::optional<std::string_view> permission_name(uint8_t bit) const;
};

struct integration_descriptor_t final {
  std::string_view name;
  bulwark::schema::integration_program_t program{};
};

/// Program id of a named integration, BLAKE3 of a domain separated label.
bulwark::schema::integration_program_t derive_program_id(
    std::string_view integration);

/// Static protocol and permission tables. Lookups by name ignore case.
class registry final {
 public:
  explicit registry(std::vector<protocol_descriptor_t> protocols);

  /// Tables for glamProtocol, splToken, drift, kamino and cctp.
  static const registry& standard();

  std::optional<protocol_descriptor_t> resolve(
      const bulwark::schema::integration_program_t& program,
      bulwark::schema::protocol_bitflag_t bitflag) const;

  std::optional<protocol_descriptor_t> resolve_by_name(
      std::string_view name) const;

  /// Mask of the named permissions; std::nullopt as soon as one name is not
  /// declared by the protocol.
  std::optional<bulwark::schema::permissions_bitmask_t> permission_mask(
      const protocol_descriptor_t& protocol,
      const std::vector<std::string>& names) const;

  /// Integration by name ("drift") or by program key (base58 or hex).
  std::optional<bulwark::schema::integration_program_t> resolve_integration(
      std::string_view name_or_program) const;

  std::optional<std::string_view> integration_name(
      const bulwark::schema::integration_program_t& program) const;

  std::vector<integration_descriptor_t> integrations() const;

  std::vector<protocol_descriptor_t> protocols_of(
      const bulwark::schema::integration_program_t& program) const;

  /// Union of every protocol bitflag the integration declares.
  bulwark::schema::protocols_bitmask_t all_protocols(
      const bulwark::schema::integration_program_t& program) const;

 private:
  std::vector<protocol_descriptor_t> protocols_;
  std::vector<integration_descriptor_t> integrations_;
};

}  // namespace bulwark::policy
