#include <bulwark/acl/delegate_access.hpp>
#include <bulwark/acl/integration_access.hpp>
#include <bulwark/common/critical.hpp>
#include <bulwark/execution/controller.hpp>
#include <bulwark/policy/bitmask.hpp>
#include <bulwark/policy/protocol_policies.hpp>
#include <bulwark/timelock/diff.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace bulwark::execution {

namespace {

using bulwark::schema::policy_error_code;
using bulwark::schema::state_field_t;

constexpr auto kCodespace = "bulwark.controller";
constexpr auto kMaxSlippageBps = uint16_t{10'000};

using compute_t = std::function<std::optional<bulwark::schema::operation_result_t>(
    bulwark::schema::vault_state_t&,
    bulwark::schema::timestamp_seconds_t)>;

bulwark::schema::operation_result_t error(const policy_error_code code,
                                          std::string log,
                                          std::string info = {}) {
  return bulwark::schema::make_error(code, std::move(log), std::move(info),
                                     kCodespace);
}

template <typename Update>
Update projected_as(const bulwark::schema::vault_state_t& state,
                    const state_field_t field) {
  return std::get<Update>(bulwark::timelock::projected(state, field));
}

std::string join(const std::vector<std::string>& parts) {
  auto out = std::string{};
  for (const auto& part : parts) {
    if (!out.empty()) {
      out += ", ";
    }
    out += part;
  }
  return out;
}

// Decode the protocol's current policy (or the empty default), let `edit`
// change it and submit the integration list carrying the new payload.
template <typename Policy, typename Edit>
std::optional<bulwark::schema::operation_result_t> edit_policy(
    bulwark::schema::vault_state_t& next,
    const bulwark::schema::timestamp_seconds_t now,
    const bulwark::policy::protocol_descriptor_t& protocol,
    Edit&& edit) {
  auto acls = projected_as<bulwark::schema::integration_acls_update_t>(
      next, state_field_t::integration_acls);
  const auto& program = protocol.integration_program;
  if (!bulwark::acl::find_integration(acls.value, program)) {
    return error(policy_error_code::integration_not_enabled,
                 fmt::format("integration {} is not enabled",
                             protocol.integration));
  }
  if (!bulwark::acl::is_protocol_enabled(acls.value, program,
                                         protocol.bitflag)) {
    return error(policy_error_code::protocol_not_enabled,
                 fmt::format("protocol {} is not enabled", protocol.name));
  }

  auto bytes = bulwark::acl::find_policy(acls.value, program, protocol.bitflag)
                   .value_or(Policy{}.encode());
  auto policy = Policy::try_decode(bytes);
  if (!policy) {
    return error(policy_error_code::invalid_policy_data,
                 fmt::format("stored {} policy does not decode", protocol.name),
                 bulwark::schema::to_hex(bytes));
  }
  if (auto failure = edit(*policy)) {
    return failure;
  }
  if (auto failure = bulwark::acl::set_protocol_policy(
          acls.value, program, protocol.bitflag, policy->encode())) {
    return error(*failure, fmt::format("cannot store {} policy", protocol.name));
  }
  bulwark::timelock::submit(next, std::move(acls), now);
  return std::nullopt;
}

template <typename T>
std::optional<bulwark::schema::operation_result_t> toggle_member(
    bulwark::policy::allowlist<T>& list,
    const T& principal,
    const bool add,
    const std::string_view protocol) {
  auto rendered = bulwark::policy::principal_traits<T>::to_string(principal);
  if (add && !list.add(principal)) {
    return error(policy_error_code::principal_already_allowed,
                 fmt::format("{} is already in the {} allowlist", rendered,
                             protocol));
  }
  if (!add && !list.remove(principal)) {
    return error(policy_error_code::principal_not_allowed,
                 fmt::format("{} is not in the {} allowlist", rendered,
                             protocol));
  }
  return std::nullopt;
}

struct allowlist_plan_t final {
  compute_t compute;
  std::string context;
  std::optional<bulwark::schema::operation_result_t> failure;
};

template <typename Policy, typename T, typename Accessor>
allowlist_plan_t plan_allowlist_edit(
    const bulwark::policy::registry& protocols,
    const std::string_view protocol_name,
    const std::string_view text,
    const bool add,
    Accessor accessor) {
  auto plan = allowlist_plan_t{};
  auto protocol = protocols.resolve_by_name(protocol_name);
  if (!protocol) {
    plan.failure = error(policy_error_code::unknown_protocol,
                         fmt::format("unknown protocol {}", protocol_name));
    return plan;
  }
  auto principal = bulwark::policy::principal_traits<T>::try_parse(text);
  if (!principal) {
    plan.failure = error(policy_error_code::invalid_argument,
                         fmt::format("invalid {} principal '{}'",
                                     protocol_name, text));
    return plan;
  }
  plan.context = fmt::format(
      "field=integrationAcls protocol={} {}={}", protocol_name,
      add ? "add" : "remove",
      bulwark::policy::principal_traits<T>::to_string(*principal));
  plan.compute = [protocol = *protocol, principal = *principal, add, accessor](
                     bulwark::schema::vault_state_t& next,
                     const bulwark::schema::timestamp_seconds_t now) {
    return edit_policy<Policy>(next, now, protocol, [&](Policy& policy) {
      return toggle_member(accessor(policy), principal, add, protocol.name);
    });
  };
  return plan;
}

}  // namespace

controller::controller(bulwark::ledger::state_reader& reader,
                       bulwark::ledger::state_mutator& mutator,
                       const bulwark::policy::registry& protocols,
                       clock_fn_t clock)
    : reader_{reader},
      mutator_{mutator},
      protocols_{protocols},
      clock_{std::move(clock)} {}

std::optional<bulwark::schema::vault_state_t> controller::fetch(
    const bulwark::schema::pubkey_t& vault) {
  return reader_.fetch_live_state(vault);
}

bulwark::schema::operation_result_t controller::execute(
    const bulwark::schema::pubkey_t& vault,
    const std::string_view operation,
    const std::string& context,
    const compute_fn_t& compute) {
  auto retried = false;
  while (true) {
    auto state = fetch(vault);
    if (!state) {
      return error(policy_error_code::vault_missing, "vault not found",
                   bulwark::schema::to_base58(vault));
    }
    auto now = clock_();
    auto next = *state;
    if (auto failure = compute(next, now)) {
      spdlog::warn("{} refused for {}: {}", operation,
                   bulwark::schema::short_key(vault), failure->log);
      return *failure;
    }

    auto mutation = bulwark::timelock::make_mutation(*state, next);
    if (mutation.live_updates.empty() && !mutation.pending) {
      spdlog::info("{} for {} changed nothing", operation,
                   bulwark::schema::short_key(vault));
      auto unchanged = bulwark::schema::operation_result_t{};
      unchanged.info = "no changes";
      return unchanged;
    }
    auto result = mutator_.submit_mutation(mutation);
    if (result.ok()) {
      spdlog::info("{} accepted for {} ({})", operation,
                   bulwark::schema::short_key(vault),
                   result.transaction_id
                       ? bulwark::schema::to_hex(*result.transaction_id)
                       : std::string{"no transaction id"});
      return result;
    }
    if (bulwark::schema::has_code(result,
                                  policy_error_code::precondition_mismatch) &&
        !retried) {
      spdlog::warn("{} for {} raced a concurrent change, retrying once",
                   operation, bulwark::schema::short_key(vault));
      retried = true;
      continue;
    }

    spdlog::error("{} rejected for {}: {}", operation,
                  bulwark::schema::short_key(vault), result.log);
    return error(policy_error_code::remote_mutation_rejected,
                 fmt::format("{} rejected by the state authority: {}",
                             operation, result.log),
                 fmt::format("{}; remote code {} ({})", context, result.code,
                             result.info));
  }
}

bulwark::schema::operation_result_t controller::edit_permissions(
    const bulwark::schema::pubkey_t& vault,
    const bulwark::schema::pubkey_t& delegate,
    const std::string_view protocol_name,
    const std::vector<std::string>& permissions,
    const bool grant) {
  auto protocol = protocols_.resolve_by_name(protocol_name);
  if (!protocol) {
    return error(policy_error_code::unknown_protocol,
                 fmt::format("unknown protocol {}", protocol_name));
  }
  if (permissions.empty()) {
    return error(policy_error_code::invalid_argument,
                 "at least one permission name is required");
  }
  auto mask = protocols_.permission_mask(*protocol, permissions);
  if (!mask) {
    return error(policy_error_code::unknown_permission,
                 fmt::format("unknown permission for {}: {}", protocol->name,
                             join(permissions)));
  }

  auto context = fmt::format(
      "field=delegateAcls delegate={} protocol={} permissions={}",
      bulwark::schema::to_base58(delegate), protocol->name, join(permissions));
  return execute(
      vault, grant ? "grant permissions" : "revoke permissions", context,
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t now)
          -> std::optional<bulwark::schema::operation_result_t> {
        auto acls = projected_as<bulwark::schema::delegate_acls_update_t>(
            next, state_field_t::delegate_acls);
        if (grant) {
          bulwark::acl::grant(acls.value, delegate,
                              protocol->integration_program, protocol->bitflag,
                              *mask);
        } else {
          bulwark::acl::revoke(acls.value, delegate,
                               protocol->integration_program,
                               protocol->bitflag, *mask);
        }
        bulwark::timelock::submit(next, std::move(acls), now);
        return std::nullopt;
      });
}

bulwark::schema::operation_result_t controller::grant_permissions(
    const bulwark::schema::pubkey_t& vault,
    const bulwark::schema::pubkey_t& delegate,
    const std::string_view protocol,
    const std::vector<std::string>& permissions) {
  return edit_permissions(vault, delegate, protocol, permissions, true);
}

bulwark::schema::operation_result_t controller::revoke_permissions(
    const bulwark::schema::pubkey_t& vault,
    const bulwark::schema::pubkey_t& delegate,
    const std::string_view protocol,
    const std::vector<std::string>& permissions) {
  return edit_permissions(vault, delegate, protocol, permissions, false);
}

bulwark::schema::operation_result_t controller::revoke_all(
    const bulwark::schema::pubkey_t& vault,
    const bulwark::schema::pubkey_t& delegate) {
  auto context = fmt::format("field=delegateAcls delegate={} revoke=all",
                             bulwark::schema::to_base58(delegate));
  return execute(
      vault, "revoke all", context,
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t now)
          -> std::optional<bulwark::schema::operation_result_t> {
        auto removed = bulwark::acl::revoke_all(next.delegate_acls, delegate);
        auto staged = bulwark::timelock::staged_value(
            next, state_field_t::delegate_acls);
        if (staged) {
          auto value = std::get<bulwark::schema::delegate_acls_update_t>(
              std::move(*staged));
          if (bulwark::acl::revoke_all(value.value, delegate)) {
            removed = true;
            bulwark::timelock::stage(next, std::move(value), now);
          }
        }
        if (!removed) {
          return error(policy_error_code::delegate_not_found,
                       fmt::format("delegate {} not found",
                                   bulwark::schema::to_base58(delegate)));
        }
        return std::nullopt;
      });
}

bulwark::schema::operation_result_t controller::set_delegate_expiry(
    const bulwark::schema::pubkey_t& vault,
    const bulwark::schema::pubkey_t& delegate,
    const bulwark::schema::timestamp_seconds_t expires_at) {
  auto context = fmt::format("field=delegateAcls delegate={} expires_at={}",
                             bulwark::schema::to_base58(delegate), expires_at);
  return execute(
      vault, "set delegate expiry", context,
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t now)
          -> std::optional<bulwark::schema::operation_result_t> {
        auto acls = projected_as<bulwark::schema::delegate_acls_update_t>(
            next, state_field_t::delegate_acls);
        if (!bulwark::acl::set_expiry(acls.value, delegate, expires_at)) {
          return error(policy_error_code::delegate_not_found,
                       fmt::format("delegate {} not found",
                                   bulwark::schema::to_base58(delegate)));
        }
        bulwark::timelock::submit(next, std::move(acls), now);
        return std::nullopt;
      });
}

bulwark::schema::operation_result_t controller::purge_expired_delegates(
    const bulwark::schema::pubkey_t& vault) {
  auto purged = std::size_t{0};
  auto result = execute(
      vault, "purge expired delegates", "field=delegateAcls purge=expired",
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t now)
          -> std::optional<bulwark::schema::operation_result_t> {
        auto acls = projected_as<bulwark::schema::delegate_acls_update_t>(
            next, state_field_t::delegate_acls);
        purged = bulwark::acl::purge_expired(acls.value, now);
        bulwark::timelock::submit(next, std::move(acls), now);
        return std::nullopt;
      });
  if (result.ok()) {
    result.info = fmt::format("{} expired delegate(s) removed", purged);
  }
  return result;
}

bulwark::schema::operation_result_t controller::enable_integration(
    const bulwark::schema::pubkey_t& vault,
    const std::string_view integration,
    const std::vector<std::string>& protocols) {
  auto program = protocols_.resolve_integration(integration);
  if (!program) {
    return error(policy_error_code::unknown_protocol,
                 fmt::format("unknown integration {}", integration));
  }
  auto mask = bulwark::schema::protocols_bitmask_t{0};
  if (protocols.empty()) {
    mask = protocols_.all_protocols(*program);
  }
  for (const auto& name : protocols) {
    auto protocol = protocols_.resolve_by_name(name);
    if (!protocol || protocol->integration_program != *program) {
      return error(policy_error_code::unknown_protocol,
                   fmt::format("{} is not a protocol of {}", name,
                               integration));
    }
    mask = static_cast<bulwark::schema::protocols_bitmask_t>(
        mask | protocol->bitflag);
  }

  auto context = fmt::format("field=integrationAcls integration={} enable={}",
                             integration, bulwark::policy::format_bits(mask));
  return execute(
      vault, "enable integration", context,
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t now)
          -> std::optional<bulwark::schema::operation_result_t> {
        auto acls = projected_as<bulwark::schema::integration_acls_update_t>(
            next, state_field_t::integration_acls);
        auto existing = bulwark::acl::find_integration(acls.value, *program);
        // a disabled integration keeps its entry; enabling it again only
        // switches protocol bits back on
        auto failure =
            existing && existing->protocols_bitmask == 0
                ? bulwark::acl::set_protocols(acls.value, *program, mask, true)
                : bulwark::acl::enable_integration(acls.value, *program, mask);
        if (failure) {
          return error(*failure, fmt::format("cannot enable integration {}",
                                             integration));
        }
        bulwark::timelock::submit(next, std::move(acls), now);
        return std::nullopt;
      });
}

bulwark::schema::operation_result_t controller::disable_integration(
    const bulwark::schema::pubkey_t& vault,
    const std::string_view integration) {
  auto program = protocols_.resolve_integration(integration);
  if (!program) {
    return error(policy_error_code::unknown_protocol,
                 fmt::format("unknown integration {}", integration));
  }
  auto context = fmt::format("field=integrationAcls integration={} enable=0",
                             integration);
  return execute(
      vault, "disable integration", context,
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t now)
          -> std::optional<bulwark::schema::operation_result_t> {
        auto acls = projected_as<bulwark::schema::integration_acls_update_t>(
            next, state_field_t::integration_acls);
        if (auto failure =
                bulwark::acl::disable_integration(acls.value, *program)) {
          return error(*failure, fmt::format("cannot disable integration {}",
                                             integration));
        }
        bulwark::timelock::submit(next, std::move(acls), now);
        return std::nullopt;
      });
}

bulwark::schema::operation_result_t controller::set_protocols_enabled(
    const bulwark::schema::pubkey_t& vault,
    const std::vector<std::string>& protocols,
    const bool enabled) {
  if (protocols.empty()) {
    return error(policy_error_code::invalid_argument,
                 "at least one protocol name is required");
  }
  auto resolved = std::vector<bulwark::policy::protocol_descriptor_t>{};
  for (const auto& name : protocols) {
    auto protocol = protocols_.resolve_by_name(name);
    if (!protocol) {
      return error(policy_error_code::unknown_protocol,
                   fmt::format("unknown protocol {}", name));
    }
    resolved.push_back(std::move(*protocol));
  }

  auto context = fmt::format("field=integrationAcls protocols={} enabled={}",
                             join(protocols), enabled);
  return execute(
      vault, enabled ? "enable protocols" : "disable protocols", context,
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t now)
          -> std::optional<bulwark::schema::operation_result_t> {
        auto acls = projected_as<bulwark::schema::integration_acls_update_t>(
            next, state_field_t::integration_acls);
        for (const auto& protocol : resolved) {
          if (auto failure = bulwark::acl::set_protocols(
                  acls.value, protocol.integration_program, protocol.bitflag,
                  enabled)) {
            return error(*failure,
                         fmt::format("integration {} is not enabled",
                                     protocol.integration));
          }
        }
        bulwark::timelock::submit(next, std::move(acls), now);
        return std::nullopt;
      });
}

bulwark::schema::operation_result_t controller::edit_allowlist(
    const bulwark::schema::pubkey_t& vault,
    const allowlist_target_t target,
    const std::string_view principal,
    const bool add) {
  using bulwark::policy::market_index_t;
  using bulwark::schema::pubkey_t;

  auto plan = [&]() -> allowlist_plan_t {
    switch (target) {
      case allowlist_target_t::transfer_destination:
        return plan_allowlist_edit<bulwark::policy::transfer_policy_t,
                                   pubkey_t>(
            protocols_, "SplToken", principal, add,
            [](auto& policy) -> auto& { return policy.allowed; });
      case allowlist_target_t::swap_token:
        return plan_allowlist_edit<bulwark::policy::jupiter_swap_policy_t,
                                   pubkey_t>(
            protocols_, "JupiterSwap", principal, add,
            [](auto& policy) -> auto& { return policy.allowed; });
      case allowlist_target_t::cctp_destination:
        return plan_allowlist_edit<bulwark::policy::cctp_policy_t,
                                   bulwark::policy::cctp_destination_t>(
            protocols_, "CCTP", principal, add,
            [](auto& policy) -> auto& { return policy.allowed; });
      case allowlist_target_t::drift_spot_market:
        return plan_allowlist_edit<bulwark::policy::drift_protocol_policy_t,
                                   market_index_t>(
            protocols_, "DriftProtocol", principal, add,
            [](auto& policy) -> auto& { return policy.spot_markets; });
      case allowlist_target_t::drift_perp_market:
        return plan_allowlist_edit<bulwark::policy::drift_protocol_policy_t,
                                   market_index_t>(
            protocols_, "DriftProtocol", principal, add,
            [](auto& policy) -> auto& { return policy.perp_markets; });
      case allowlist_target_t::drift_borrow:
        return plan_allowlist_edit<bulwark::policy::drift_protocol_policy_t,
                                   pubkey_t>(
            protocols_, "DriftProtocol", principal, add,
            [](auto& policy) -> auto& { return policy.borrow_allowlist; });
      case allowlist_target_t::drift_vault:
        return plan_allowlist_edit<bulwark::policy::drift_vaults_policy_t,
                                   pubkey_t>(
            protocols_, "DriftVaults", principal, add,
            [](auto& policy) -> auto& { return policy.allowed; });
      case allowlist_target_t::kamino_market:
        return plan_allowlist_edit<bulwark::policy::kamino_lending_policy_t,
                                   pubkey_t>(
            protocols_, "KaminoLend", principal, add,
            [](auto& policy) -> auto& { return policy.markets; });
      case allowlist_target_t::kamino_borrow:
        return plan_allowlist_edit<bulwark::policy::kamino_lending_policy_t,
                                   pubkey_t>(
            protocols_, "KaminoLend", principal, add,
            [](auto& policy) -> auto& { return policy.borrow_allowlist; });
      case allowlist_target_t::kamino_vault:
        return plan_allowlist_edit<bulwark::policy::kamino_vaults_policy_t,
                                   pubkey_t>(
            protocols_, "KaminoVaults", principal, add,
            [](auto& policy) -> auto& { return policy.allowed; });
    }
    return allowlist_plan_t{
        .failure = error(policy_error_code::invalid_argument,
                         "unknown allowlist target")};
  }();

  if (plan.failure) {
    return *plan.failure;
  }
  auto operation = fmt::format("{} {}", add ? "allowlist add" : "allowlist remove",
                               to_string(target));
  return execute(vault, operation, plan.context, plan.compute);
}

bulwark::schema::operation_result_t controller::allowlist_add(
    const bulwark::schema::pubkey_t& vault,
    const allowlist_target_t target,
    const std::string_view principal) {
  return edit_allowlist(vault, target, principal, true);
}

bulwark::schema::operation_result_t controller::allowlist_remove(
    const bulwark::schema::pubkey_t& vault,
    const allowlist_target_t target,
    const std::string_view principal) {
  return edit_allowlist(vault, target, principal, false);
}

bulwark::schema::operation_result_t controller::set_max_slippage(
    const bulwark::schema::pubkey_t& vault,
    const uint16_t max_slippage_bps) {
  if (max_slippage_bps > kMaxSlippageBps) {
    return error(policy_error_code::invalid_argument,
                 fmt::format("slippage {} bps exceeds {} bps", max_slippage_bps,
                             kMaxSlippageBps));
  }
  auto protocol = protocols_.resolve_by_name("JupiterSwap");
  if (!protocol) {
    return error(policy_error_code::unknown_protocol,
                 "unknown protocol JupiterSwap");
  }
  auto context = fmt::format("field=integrationAcls protocol=JupiterSwap "
                             "max_slippage_bps={}",
                             max_slippage_bps);
  return execute(
      vault, "set max slippage", context,
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t now) {
        return edit_policy<bulwark::policy::jupiter_swap_policy_t>(
            next, now, *protocol,
            [&](bulwark::policy::jupiter_swap_policy_t& policy)
                -> std::optional<bulwark::schema::operation_result_t> {
              policy.trailer.max_slippage_bps = max_slippage_bps;
              return std::nullopt;
            });
      });
}

bulwark::schema::operation_result_t controller::clear_swap_allowlist(
    const bulwark::schema::pubkey_t& vault) {
  auto protocol = protocols_.resolve_by_name("JupiterSwap");
  if (!protocol) {
    return error(policy_error_code::unknown_protocol,
                 "unknown protocol JupiterSwap");
  }
  return execute(
      vault, "clear swap allowlist",
      "field=integrationAcls protocol=JupiterSwap allowlist=cleared",
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t now) {
        return edit_policy<bulwark::policy::jupiter_swap_policy_t>(
            next, now, *protocol,
            [](bulwark::policy::jupiter_swap_policy_t& policy)
                -> std::optional<bulwark::schema::operation_result_t> {
              policy.allowed.clear();
              return std::nullopt;
            });
      });
}

bulwark::schema::operation_result_t controller::edit_pubkey_set(
    const bulwark::schema::pubkey_t& vault,
    const state_field_t field,
    const bulwark::schema::pubkey_t& key,
    const bool add) {
  auto field_name = bulwark::schema::to_string(field);
  auto rendered = bulwark::schema::to_base58(key);
  auto context = fmt::format("field={} {}={}", field_name,
                             add ? "add" : "remove", rendered);
  auto operation = fmt::format("{} {}", add ? "add to" : "remove from",
                               field_name);
  return execute(
      vault, operation, context,
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t now)
          -> std::optional<bulwark::schema::operation_result_t> {
        auto update = bulwark::timelock::projected(next, field);
        auto& keys = std::visit(
            overloaded{
                [](bulwark::schema::assets_update_t& value)
                    -> std::vector<bulwark::schema::pubkey_t>& {
                  return value.value;
                },
                [](bulwark::schema::borrowable_update_t& value)
                    -> std::vector<bulwark::schema::pubkey_t>& {
                  return value.value;
                },
                [](auto&) -> std::vector<bulwark::schema::pubkey_t>& {
                  bulwark::common::critical("field does not hold keys");
                }},
            update);
        auto it = std::find(std::begin(keys), std::end(keys), key);
        if (add && it != std::end(keys)) {
          return error(policy_error_code::principal_already_allowed,
                       fmt::format("{} is already in {}", rendered, field_name));
        }
        if (!add && it == std::end(keys)) {
          return error(policy_error_code::principal_not_allowed,
                       fmt::format("{} is not in {}", rendered, field_name));
        }
        if (add) {
          keys.push_back(key);
        } else {
          keys.erase(it);
        }
        bulwark::timelock::submit(next, std::move(update), now);
        return std::nullopt;
      });
}

bulwark::schema::operation_result_t controller::add_asset(
    const bulwark::schema::pubkey_t& vault,
    const bulwark::schema::pubkey_t& asset) {
  return edit_pubkey_set(vault, state_field_t::assets, asset, true);
}

bulwark::schema::operation_result_t controller::remove_asset(
    const bulwark::schema::pubkey_t& vault,
    const bulwark::schema::pubkey_t& asset) {
  return edit_pubkey_set(vault, state_field_t::assets, asset, false);
}

bulwark::schema::operation_result_t controller::add_borrowable(
    const bulwark::schema::pubkey_t& vault,
    const bulwark::schema::pubkey_t& asset) {
  return edit_pubkey_set(vault, state_field_t::borrowable, asset, true);
}

bulwark::schema::operation_result_t controller::remove_borrowable(
    const bulwark::schema::pubkey_t& vault,
    const bulwark::schema::pubkey_t& asset) {
  return edit_pubkey_set(vault, state_field_t::borrowable, asset, false);
}

bulwark::schema::operation_result_t controller::set_timelock_duration(
    const bulwark::schema::pubkey_t& vault,
    const bulwark::schema::duration_seconds_t duration) {
  auto context = fmt::format("field=timelockDuration value={}", duration);
  return execute(
      vault, "set timelock duration", context,
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t now)
          -> std::optional<bulwark::schema::operation_result_t> {
        bulwark::timelock::submit(
            next, bulwark::schema::timelock_duration_update_t{duration}, now);
        return std::nullopt;
      });
}

bulwark::schema::operation_result_t controller::apply_timelock(
    const bulwark::schema::pubkey_t& vault) {
  return execute(
      vault, "apply timelock", "pending=apply",
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t now)
          -> std::optional<bulwark::schema::operation_result_t> {
        auto remaining = bulwark::timelock::remaining_seconds(next, now);
        if (auto failure = bulwark::timelock::apply(next, now)) {
          return error(*failure, "cannot apply staged changes",
                       *failure == policy_error_code::timelock_not_expired
                           ? fmt::format("{}s remaining", remaining)
                           : std::string{});
        }
        return std::nullopt;
      });
}

bulwark::schema::operation_result_t controller::cancel_timelock(
    const bulwark::schema::pubkey_t& vault) {
  return execute(
      vault, "cancel timelock", "pending=cancel",
      [&](bulwark::schema::vault_state_t& next,
          const bulwark::schema::timestamp_seconds_t)
          -> std::optional<bulwark::schema::operation_result_t> {
        if (auto failure = bulwark::timelock::cancel(next)) {
          return error(*failure, "cannot cancel staged changes");
        }
        return std::nullopt;
      });
}

timelock_report_t controller::timelock_report(
    const bulwark::schema::pubkey_t& vault) {
  auto report = timelock_report_t{};
  auto state = fetch(vault);
  if (!state) {
    report.result = error(policy_error_code::vault_missing, "vault not found",
                          bulwark::schema::to_base58(vault));
    return report;
  }
  auto now = clock_();
  report.status = bulwark::timelock::status(*state, now);
  report.duration = state->timelock_duration;
  report.expires_at = state->pending.expires_at;
  report.remaining = bulwark::timelock::remaining_seconds(*state, now);

  if (report.status == bulwark::timelock::timelock_status_t::idle) {
    report.lines.push_back(
        fmt::format("Timelock: {} seconds", report.duration));
    return report;
  }
  report.lines.push_back(fmt::format(
      "Timelock: {} seconds, remaining: {}s ({}m {}s)", report.duration,
      report.remaining, report.remaining / 60, report.remaining % 60));
  report.lines.emplace_back("");
  report.lines.emplace_back("Pending state updates:");
  for (const auto& update : state->pending.updates) {
    auto field = bulwark::schema::field_of(update);
    auto lines = bulwark::timelock::render(
        field, bulwark::timelock::diff(*state, field, protocols_), protocols_);
    std::move(std::begin(lines), std::end(lines),
              std::back_inserter(report.lines));
  }
  return report;
}

listing_t controller::view_policy(const bulwark::schema::pubkey_t& vault,
                                  const std::string_view protocol_name) {
  auto listing = listing_t{};
  auto protocol = protocols_.resolve_by_name(protocol_name);
  if (!protocol) {
    listing.result = error(policy_error_code::unknown_protocol,
                           fmt::format("unknown protocol {}", protocol_name));
    return listing;
  }
  auto state = fetch(vault);
  if (!state) {
    listing.result = error(policy_error_code::vault_missing, "vault not found",
                           bulwark::schema::to_base58(vault));
    return listing;
  }
  auto bytes = bulwark::acl::find_policy(
      state->integration_acls, protocol->integration_program, protocol->bitflag);
  if (!bytes || protocol->schema == bulwark::policy::policy_schema_t::none) {
    listing.result = error(policy_error_code::policy_not_found,
                           fmt::format("no {} policy found", protocol->name));
    return listing;
  }
  auto decoded = bulwark::policy::try_decode_policy(protocol->schema, *bytes);
  if (!decoded) {
    listing.result = error(policy_error_code::invalid_policy_data,
                           fmt::format("stored {} policy does not decode",
                                       protocol->name),
                           bulwark::schema::to_hex(*bytes));
    return listing;
  }
  listing.lines = bulwark::policy::describe_policy(
      *decoded, protocol->empty_allowlist);
  if (!bulwark::acl::is_protocol_enabled(state->integration_acls,
                                         protocol->integration_program,
                                         protocol->bitflag)) {
    listing.lines.emplace_back("(protocol disabled, policy dormant)");
  }
  return listing;
}

listing_t controller::list_integrations(
    const bulwark::schema::pubkey_t& vault) {
  auto listing = listing_t{};
  auto state = fetch(vault);
  if (!state) {
    listing.result = error(policy_error_code::vault_missing, "vault not found",
                           bulwark::schema::to_base58(vault));
    return listing;
  }
  auto index = std::size_t{0};
  for (const auto& acl : state->integration_acls) {
    auto name = protocols_.integration_name(acl.integration_program)
                    .value_or("unknown");
    auto enabled = bulwark::policy::protocol_names(
        protocols_, acl.integration_program, acl.protocols_bitmask);
    listing.lines.push_back(fmt::format(
        "[{}] {} ({}) protocols {}: {}", index++, name,
        bulwark::schema::to_base58(acl.integration_program),
        bulwark::policy::format_bits(acl.protocols_bitmask),
        enabled.empty() ? std::string{"none"} : join(enabled)));
  }
  return listing;
}

listing_t controller::list_delegates(const bulwark::schema::pubkey_t& vault) {
  auto listing = listing_t{};
  auto state = fetch(vault);
  if (!state) {
    listing.result = error(policy_error_code::vault_missing, "vault not found",
                           bulwark::schema::to_base58(vault));
    return listing;
  }
  auto index = std::size_t{0};
  for (const auto& acl : state->delegate_acls) {
    listing.lines.push_back(
        fmt::format("[{}] {} expires {}", index++,
                    bulwark::schema::to_base58(acl.pubkey),
                    acl.expires_at == 0 ? std::string{"never"}
                                        : std::to_string(acl.expires_at)));
    for (const auto& integration : acl.integration_permissions) {
      listing.lines.push_back(fmt::format(
          "  Integration: {}",
          protocols_.integration_name(integration.integration_program)
              .value_or("unknown")));
      for (const auto& protocol : integration.protocol_permissions) {
        auto protocol_name = bulwark::policy::protocol_names(
            protocols_, integration.integration_program,
            protocol.protocol_bitflag);
        auto permissions = bulwark::policy::permission_names(
            protocols_, integration.integration_program,
            protocol.protocol_bitflag, protocol.permissions_bitmask);
        listing.lines.push_back(fmt::format(
            "    {}: {}",
            protocol_name.empty() ? std::string{"Unknown"}
                                  : protocol_name.front(),
            permissions.empty()
                ? bulwark::policy::format_bits(protocol.permissions_bitmask)
                : join(permissions)));
      }
    }
  }
  return listing;
}

}  // namespace bulwark::execution
