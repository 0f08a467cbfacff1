#include <bulwark/blake3/hash.hpp>
#include <bulwark/policy/registry.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace bulwark::policy {

namespace {

bool iequals(const std::string_view lhs, const std::string_view rhs) {
  return lhs.size() == rhs.size() &&
         std::equal(std::begin(lhs), std::end(lhs), std::begin(rhs),
                    [](const char a, const char b) {
                      return std::tolower(static_cast<unsigned char>(a)) ==
                             std::tolower(static_cast<unsigned char>(b));
                    });
}

protocol_descriptor_t make_protocol(
    const std::string_view integration,
    const std::string_view name,
    const bulwark::schema::protocol_bitflag_t bitflag,
    std::vector<permission_descriptor_t> permissions,
    const policy_schema_t schema,
    const empty_allowlist_t empty_allowlist) {
  return protocol_descriptor_t{.integration = integration,
                               .integration_program =
                                   derive_program_id(integration),
                               .name = name,
                               .bitflag = bitflag,
                               .permissions = std::move(permissions),
                               .schema = schema,
                               .empty_allowlist = empty_allowlist};
}

std::vector<protocol_descriptor_t> standard_protocols() {
  using enum policy_schema_t;
  constexpr auto kOpen = empty_allowlist_t::unrestricted;
  constexpr auto kDeny = empty_allowlist_t::deny_all;
  return {
      make_protocol("glamProtocol", "SystemProgram", 0b001,
                    {{0, "Transfer"}}, none, kOpen),
      make_protocol("glamProtocol", "StakeProgram", 0b010,
                    {{0, "Stake"}, {1, "Unstake"}}, none, kOpen),
      make_protocol("glamProtocol", "JupiterSwap", 0b100,
                    {{0, "SwapAny"}, {1, "SwapLst"}, {2, "SwapAllowlisted"}},
                    jupiter_swap, kOpen),
      make_protocol("splToken", "SplToken", 0b01, {{0, "Transfer"}}, transfer,
                    kDeny),
      make_protocol("drift", "DriftProtocol", 0b01,
                    {{0, "InitUser"},
                     {1, "UpdateUser"},
                     {2, "DeleteUser"},
                     {3, "Deposit"},
                     {4, "Withdraw"},
                     {5, "Borrow"},
                     {6, "CreateModifyOrders"},
                     {7, "CancelOrders"},
                     {8, "PerpMarkets"},
                     {9, "SpotMarkets"}},
                    drift_protocol, kOpen),
      make_protocol("drift", "DriftVaults", 0b10,
                    {{0, "Deposit"}, {1, "Withdraw"}}, drift_vaults, kOpen),
      make_protocol("kamino", "KaminoLend", 0b001,
                    {{0, "Init"},
                     {1, "Deposit"},
                     {2, "Withdraw"},
                     {3, "Borrow"},
                     {4, "Repay"}},
                    kamino_lending, kOpen),
      make_protocol("kamino", "KaminoVaults", 0b010,
                    {{0, "Deposit"}, {1, "Withdraw"}}, kamino_vaults, kOpen),
      make_protocol("kamino", "KaminoFarms", 0b100,
                    {{0, "Stake"}, {1, "Unstake"}, {2, "HarvestReward"}}, none,
                    kOpen),
      make_protocol("cctp", "CCTP", 0b01, {{0, "Transfer"}}, cctp, kDeny),
  };
}

}  // namespace

std::optional<std::string_view> protocol_descriptor_t::permission_name(
    const uint8_t bit) const {
  for (const auto& permission : permissions) {
    if (permission.bit == bit) {
      return permission.name;
    }
  }
  return std::nullopt;
}

bulwark::schema::integration_program_t derive_program_id(
    const std::string_view integration) {
  return bulwark::blake3::hasher{}
      .update(std::string_view{"bulwark/integration/"})
      .update(integration)
      .finalize();
}

registry::registry(std::vector<protocol_descriptor_t> protocols)
    : protocols_{std::move(protocols)} {
  for (const auto& protocol : protocols_) {
    auto known = std::find_if(
        std::begin(integrations_), std::end(integrations_),
        [&](const auto& entry) {
          return entry.program == protocol.integration_program;
        });
    if (known == std::end(integrations_)) {
      integrations_.push_back(integration_descriptor_t{
          .name = protocol.integration,
          .program = protocol.integration_program});
    }
  }
}

const registry& registry::standard() {
  static const auto instance = registry{standard_protocols()};
  return instance;
}

std::optional<protocol_descriptor_t> registry::resolve(
    const bulwark::schema::integration_program_t& program,
    const bulwark::schema::protocol_bitflag_t bitflag) const {
  for (const auto& protocol : protocols_) {
    if (protocol.integration_program == program && protocol.bitflag == bitflag) {
      return protocol;
    }
  }
  return std::nullopt;
}

std::optional<protocol_descriptor_t> registry::resolve_by_name(
    const std::string_view name) const {
  for (const auto& protocol : protocols_) {
    if (iequals(protocol.name, name)) {
      return protocol;
    }
  }
  return std::nullopt;
}

std::optional<bulwark::schema::permissions_bitmask_t> registry::permission_mask(
    const protocol_descriptor_t& protocol,
    const std::vector<std::string>& names) const {
  auto mask = bulwark::schema::permissions_bitmask_t{0};
  for (const auto& name : names) {
    auto match = std::find_if(
        std::begin(protocol.permissions), std::end(protocol.permissions),
        [&](const auto& permission) { return iequals(permission.name, name); });
    if (match == std::end(protocol.permissions)) {
      return std::nullopt;
    }
    mask |= bulwark::schema::permissions_bitmask_t{1} << match->bit;
  }
  return mask;
}

std::optional<bulwark::schema::integration_program_t>
registry::resolve_integration(const std::string_view name_or_program) const {
  for (const auto& integration : integrations_) {
    if (iequals(integration.name, name_or_program)) {
      return integration.program;
    }
  }
  auto program = bulwark::schema::try_parse_pubkey(name_or_program);
  if (!program) {
    return std::nullopt;
  }
  if (!integration_name(*program)) {
    return std::nullopt;
  }
  return program;
}

std::optional<std::string_view> registry::integration_name(
    const bulwark::schema::integration_program_t& program) const {
  for (const auto& integration : integrations_) {
    if (integration.program == program) {
      return integration.name;
    }
  }
  return std::nullopt;
}

std::vector<integration_descriptor_t> registry::integrations() const {
  return integrations_;
}

std::vector<protocol_descriptor_t> registry::protocols_of(
    const bulwark::schema::integration_program_t& program) const {
  auto protocols = std::vector<protocol_descriptor_t>{};
  std::copy_if(std::begin(protocols_), std::end(protocols_),
               std::back_inserter(protocols), [&](const auto& protocol) {
                 return protocol.integration_program == program;
               });
  return protocols;
}

bulwark::schema::protocols_bitmask_t registry::all_protocols(
    const bulwark::schema::integration_program_t& program) const {
  auto mask = bulwark::schema::protocols_bitmask_t{0};
  for (const auto& protocol : protocols_) {
    if (protocol.integration_program == program) {
      mask = static_cast<bulwark::schema::protocols_bitmask_t>(mask |
                                                               protocol.bitflag);
    }
  }
  return mask;
}

}  // namespace bulwark::policy
