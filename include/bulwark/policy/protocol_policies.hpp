#pragma once
#include <bulwark/policy/allowlist.hpp>
#include <bulwark/policy/allowlist_policy.hpp>
#include <bulwark/policy/principal.hpp>
#include <bulwark/schema/enum_string.hpp>
#include <bulwark/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bulwark::policy {

enum class policy_schema_t : uint8_t {
  none = 0,
  transfer = 1,
  jupiter_swap = 2,
  cctp = 3,
  drift_protocol = 4,
  drift_vaults = 5,
  kamino_lending = 6,
  kamino_vaults = 7
};

inline constexpr auto kPolicySchemaMappings = std::array{
    std::pair<std::string_view, policy_schema_t>{"none", policy_schema_t::none},
    std::pair<std::string_view, policy_schema_t>{"transfer",
                                                 policy_schema_t::transfer},
    std::pair<std::string_view, policy_schema_t>{
        "jupiter_swap", policy_schema_t::jupiter_swap},
    std::pair<std::string_view, policy_schema_t>{"cctp", policy_schema_t::cctp},
    std::pair<std::string_view, policy_schema_t>{
        "drift_protocol", policy_schema_t::drift_protocol},
    std::pair<std::string_view, policy_schema_t>{
        "drift_vaults", policy_schema_t::drift_vaults},
    std::pair<std::string_view, policy_schema_t>{
        "kamino_lending", policy_schema_t::kamino_lending},
    std::pair<std::string_view, policy_schema_t>{
        "kamino_vaults", policy_schema_t::kamino_vaults},
};

inline constexpr std::string_view to_string(const policy_schema_t value) {
  return bulwark::schema::to_string(value, kPolicySchemaMappings)
      .value_or("unknown");
}

// SPL token transfer destinations.
using transfer_policy_t = allowlist_policy<bulwark::schema::pubkey_t>;
// Swap output mints plus the maximum slippage in basis points.
using jupiter_swap_policy_t =
    allowlist_policy<bulwark::schema::pubkey_t, slippage_trailer>;
using cctp_policy_t = allowlist_policy<cctp_destination_t>;
using drift_vaults_policy_t = allowlist_policy<bulwark::schema::pubkey_t>;
using kamino_vaults_policy_t = allowlist_policy<bulwark::schema::pubkey_t>;

/// `[spot list][perp list][borrow list]`
struct drift_protocol_policy_t final {
  allowlist<market_index_t> spot_markets;
  allowlist<market_index_t> perp_markets;
  allowlist<bulwark::schema::pubkey_t> borrow_allowlist;

  bulwark::schema::bytes_t encode() const;
  static std::optional<drift_protocol_policy_t> try_decode(
      const bulwark::schema::bytes_view_t& bytes);

  bool operator==(const drift_protocol_policy_t&) const = default;
};

/// `[markets list][borrow list]`
struct kamino_lending_policy_t final {
  allowlist<bulwark::schema::pubkey_t> markets;
  allowlist<bulwark::schema::pubkey_t> borrow_allowlist;

  bulwark::schema::bytes_t encode() const;
  static std::optional<kamino_lending_policy_t> try_decode(
      const bulwark::schema::bytes_view_t& bytes);

  bool operator==(const kamino_lending_policy_t&) const = default;
};

// Alternatives are ordered like policy_schema_t (minus `none`); the transfer,
// drift vaults and kamino vaults payloads share one C++ type, so the schema
// travels with the value.
struct decoded_policy_t final {
  policy_schema_t schema{policy_schema_t::none};
  std::variant<transfer_policy_t,
               jupiter_swap_policy_t,
               cctp_policy_t,
               drift_protocol_policy_t,
               kamino_lending_policy_t>
      value;
};

/// Decode `bytes` as the payload of `schema`; std::nullopt on malformed data
/// or for policy_schema_t::none.
std::optional<decoded_policy_t> try_decode_policy(
    policy_schema_t schema,
    const bulwark::schema::bytes_view_t& bytes);

/// Payload written when a protocol's policy is first edited.
std::optional<bulwark::schema::bytes_t> default_policy_bytes(
    policy_schema_t schema);

/// Human readable listing, one line per entry. Empty lists are labelled
/// according to how the protocol treats them.
std::vector<std::string> describe_policy(const decoded_policy_t& policy,
                                         empty_allowlist_t semantics);

}  // namespace bulwark::policy
