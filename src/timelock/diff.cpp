#include <bulwark/policy/bitmask.hpp>
#include <bulwark/policy/protocol_policies.hpp>
#include <bulwark/timelock/diff.hpp>
#include <bulwark/timelock/engine.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace bulwark::timelock {

namespace {

using protocol_key_t = std::pair<bulwark::schema::integration_program_t,
                                 bulwark::schema::protocol_bitflag_t>;

template <typename T, typename Key>
const T* find_by(const std::vector<T>& items, const Key& key, auto identity) {
  auto it = std::find_if(std::begin(items), std::end(items),
                         [&](const auto& item) { return identity(item) == key; });
  return it == std::end(items) ? nullptr : &*it;
}

std::map<protocol_key_t, bulwark::schema::permissions_bitmask_t> flatten(
    const bulwark::schema::delegate_acl_t& acl) {
  auto flat = std::map<protocol_key_t, bulwark::schema::permissions_bitmask_t>{};
  for (const auto& integration : acl.integration_permissions) {
    for (const auto& protocol : integration.protocol_permissions) {
      flat[{integration.integration_program, protocol.protocol_bitflag}] |=
          protocol.permissions_bitmask;
    }
  }
  return flat;
}

std::map<bulwark::schema::protocol_bitflag_t, bulwark::schema::bytes_t>
policies_of(const bulwark::schema::integration_acl_t& acl) {
  auto policies =
      std::map<bulwark::schema::protocol_bitflag_t, bulwark::schema::bytes_t>{};
  for (const auto& policy : acl.protocol_policies) {
    policies[policy.protocol_bitflag] = policy.data;
  }
  return policies;
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

std::string render_expiry(const bulwark::schema::timestamp_seconds_t at) {
  return at == 0 ? std::string{"never"} : std::to_string(at);
}

std::string protocol_label(const bulwark::policy::registry& protocols,
                           const bulwark::schema::integration_program_t& program,
                           const bulwark::schema::protocol_bitflag_t bitflag) {
  auto names = bulwark::policy::protocol_names(protocols, program, bitflag);
  return names.empty() ? std::string{"Unknown"} : names.front();
}

template <typename T>
void compare_list(std::vector<allowlist_change_t>& changes,
                  const std::string_view title,
                  const bulwark::policy::allowlist<T>& before,
                  const bulwark::policy::allowlist<T>& after) {
  if (before.same_members(after)) {
    return;
  }
  auto change = allowlist_change_t{.title = std::string{title}};
  for (const auto& entry : after.entries()) {
    if (!before.contains(entry)) {
      change.added.push_back(
          bulwark::policy::principal_traits<T>::to_string(entry));
    }
  }
  for (const auto& entry : before.entries()) {
    if (!after.contains(entry)) {
      change.removed.push_back(
          bulwark::policy::principal_traits<T>::to_string(entry));
    }
  }
  changes.push_back(std::move(change));
}

void compare_decoded(policy_change_t& change,
                     const bulwark::policy::decoded_policy_t& before,
                     const bulwark::policy::decoded_policy_t& after) {
  auto& lists = change.allowlist_changes;
  std::visit(
      overloaded{
          [&](const bulwark::policy::transfer_policy_t& old_value,
              const bulwark::policy::transfer_policy_t& new_value) {
            auto title =
                after.schema == bulwark::policy::policy_schema_t::transfer
                    ? "Transfer destinations allowlist"
                    : "Vaults allowlist";
            compare_list(lists, title, old_value.allowed, new_value.allowed);
          },
          [&](const bulwark::policy::jupiter_swap_policy_t& old_value,
              const bulwark::policy::jupiter_swap_policy_t& new_value) {
            if (old_value.trailer != new_value.trailer) {
              change.slippage = slippage_change_t{
                  .before = old_value.trailer.max_slippage_bps,
                  .after = new_value.trailer.max_slippage_bps};
            }
            compare_list(lists, "Swap allowlist", old_value.allowed,
                         new_value.allowed);
          },
          [&](const bulwark::policy::cctp_policy_t& old_value,
              const bulwark::policy::cctp_policy_t& new_value) {
            compare_list(lists, "CCTP destinations allowlist",
                         old_value.allowed, new_value.allowed);
          },
          [&](const bulwark::policy::drift_protocol_policy_t& old_value,
              const bulwark::policy::drift_protocol_policy_t& new_value) {
            compare_list(lists, "Spot markets allowlist",
                         old_value.spot_markets, new_value.spot_markets);
            compare_list(lists, "Perp markets allowlist",
                         old_value.perp_markets, new_value.perp_markets);
            compare_list(lists, "Borrow allowlist",
                         old_value.borrow_allowlist,
                         new_value.borrow_allowlist);
          },
          [&](const bulwark::policy::kamino_lending_policy_t& old_value,
              const bulwark::policy::kamino_lending_policy_t& new_value) {
            compare_list(lists, "Lending markets allowlist",
                         old_value.markets, new_value.markets);
            compare_list(lists, "Borrow allowlist",
                         old_value.borrow_allowlist,
                         new_value.borrow_allowlist);
          },
          // one schema per protocol, so the alternatives always agree
          [](const auto&, const auto&) {}},
      before.value, after.value);
}

/// std::nullopt when both sides hold the same policy. A side without a
/// policy is compared as the protocol's default payload.
std::optional<policy_change_t> compare_policy(
    const bulwark::policy::registry& protocols,
    const bulwark::schema::integration_program_t& program,
    policy_change_t change) {
  auto descriptor = protocols.resolve(program, change.protocol_bitflag);
  auto fallback = std::optional<bulwark::schema::bytes_t>{};
  if (descriptor) {
    fallback = bulwark::policy::default_policy_bytes(descriptor->schema);
  }
  if (fallback) {
    auto before = bulwark::policy::try_decode_policy(
        descriptor->schema, change.before ? *change.before : *fallback);
    auto after = bulwark::policy::try_decode_policy(
        descriptor->schema, change.after ? *change.after : *fallback);
    if (before && after) {
      compare_decoded(change, *before, *after);
      if (change.before && change.after && change.allowlist_changes.empty() &&
          !change.slippage) {
        return std::nullopt;
      }
      return change;
    }
  }
  // unregistered or undecodable payloads
  if (change.before == change.after) {
    return std::nullopt;
  }
  return change;
}

}  // namespace

integration_acls_diff_t diff_integration_acls(
    const std::vector<bulwark::schema::integration_acl_t>& current,
    const std::vector<bulwark::schema::integration_acl_t>& staged,
    const bulwark::policy::registry& protocols) {
  auto program_of = [](const auto& acl) { return acl.integration_program; };
  auto result = integration_acls_diff_t{};
  for (const auto& acl : staged) {
    auto live = find_by(current, acl.integration_program, program_of);
    if (live == nullptr) {
      result.added.push_back(acl);
      continue;
    }
    auto change = integration_change_t{
        .integration_program = acl.integration_program,
        .enabled_protocols = static_cast<bulwark::schema::protocols_bitmask_t>(
            acl.protocols_bitmask & ~live->protocols_bitmask),
        .disabled_protocols = static_cast<bulwark::schema::protocols_bitmask_t>(
            live->protocols_bitmask & ~acl.protocols_bitmask)};

    auto before = policies_of(*live);
    auto after = policies_of(acl);
    auto record = [&](const bulwark::schema::protocol_bitflag_t bitflag,
                      std::optional<bulwark::schema::bytes_t> old_data,
                      std::optional<bulwark::schema::bytes_t> new_data) {
      auto policy = compare_policy(
          protocols, acl.integration_program,
          policy_change_t{.protocol_bitflag = bitflag,
                          .before = std::move(old_data),
                          .after = std::move(new_data)});
      if (policy) {
        change.policy_changes.push_back(std::move(*policy));
      }
    };
    for (const auto& [bitflag, data] : after) {
      auto previous = before.find(bitflag);
      if (previous == std::end(before)) {
        record(bitflag, std::nullopt, data);
      } else {
        record(bitflag, previous->second, data);
      }
    }
    for (const auto& [bitflag, data] : before) {
      if (after.find(bitflag) == std::end(after)) {
        record(bitflag, data, std::nullopt);
      }
    }

    if (change.enabled_protocols != 0 || change.disabled_protocols != 0 ||
        !change.policy_changes.empty()) {
      result.modified.push_back(std::move(change));
    }
  }
  for (const auto& acl : current) {
    if (find_by(staged, acl.integration_program, program_of) == nullptr) {
      result.removed.push_back(acl);
    }
  }
  return result;
}

delegate_acls_diff_t diff_delegate_acls(
    const std::vector<bulwark::schema::delegate_acl_t>& current,
    const std::vector<bulwark::schema::delegate_acl_t>& staged) {
  auto pubkey_of = [](const auto& acl) { return acl.pubkey; };
  auto result = delegate_acls_diff_t{};
  for (const auto& acl : staged) {
    auto live = find_by(current, acl.pubkey, pubkey_of);
    if (live == nullptr) {
      result.added.push_back(acl);
      continue;
    }
    auto change = delegate_change_t{.pubkey = acl.pubkey,
                                    .current_expires_at = live->expires_at,
                                    .staged_expires_at = acl.expires_at};
    auto before = flatten(*live);
    auto after = flatten(acl);
    auto keys = std::vector<protocol_key_t>{};
    for (const auto& entry : before) {
      keys.push_back(entry.first);
    }
    for (const auto& entry : after) {
      if (before.find(entry.first) == std::end(before)) {
        keys.push_back(entry.first);
      }
    }
    std::sort(std::begin(keys), std::end(keys));
    for (const auto& key : keys) {
      auto old_mask = before.contains(key) ? before.at(key) : 0;
      auto new_mask = after.contains(key) ? after.at(key) : 0;
      if (old_mask != new_mask) {
        change.permission_changes.push_back(
            permission_change_t{.integration_program = key.first,
                                .protocol_bitflag = key.second,
                                .added = new_mask & ~old_mask,
                                .removed = old_mask & ~new_mask});
      }
    }
    if (change.current_expires_at != change.staged_expires_at ||
        !change.permission_changes.empty()) {
      result.modified.push_back(std::move(change));
    }
  }
  for (const auto& acl : current) {
    if (find_by(staged, acl.pubkey, pubkey_of) == nullptr) {
      result.removed.push_back(acl);
    }
  }
  return result;
}

pubkey_set_diff_t diff_pubkeys(
    const std::vector<bulwark::schema::pubkey_t>& current,
    const std::vector<bulwark::schema::pubkey_t>& staged) {
  auto contains = [](const auto& keys, const auto& key) {
    return std::find(std::begin(keys), std::end(keys), key) != std::end(keys);
  };
  auto result = pubkey_set_diff_t{};
  for (const auto& key : staged) {
    if (!contains(current, key) && !contains(result.added, key)) {
      result.added.push_back(key);
    }
  }
  for (const auto& key : current) {
    if (!contains(staged, key) && !contains(result.removed, key)) {
      result.removed.push_back(key);
    }
  }
  return result;
}

field_diff_t diff(const bulwark::schema::vault_state_t& state,
                  const bulwark::schema::state_field_t field,
                  const bulwark::policy::registry& protocols) {
  auto staged = staged_value(state, field);
  if (!staged) {
    switch (field) {
      case bulwark::schema::state_field_t::integration_acls:
        return integration_acls_diff_t{};
      case bulwark::schema::state_field_t::delegate_acls:
        return delegate_acls_diff_t{};
      case bulwark::schema::state_field_t::assets:
      case bulwark::schema::state_field_t::borrowable:
        return pubkey_set_diff_t{};
      case bulwark::schema::state_field_t::timelock_duration:
        break;
    }
    return duration_diff_t{.current = state.timelock_duration,
                           .staged = state.timelock_duration,
                           .changed = false};
  }

  return std::visit(
      overloaded{
          [&](const bulwark::schema::integration_acls_update_t& value)
              -> field_diff_t {
            return diff_integration_acls(state.integration_acls, value.value,
                                         protocols);
          },
          [&](const bulwark::schema::delegate_acls_update_t& value)
              -> field_diff_t {
            return diff_delegate_acls(state.delegate_acls, value.value);
          },
          [&](const bulwark::schema::assets_update_t& value) -> field_diff_t {
            return diff_pubkeys(state.assets, value.value);
          },
          [&](const bulwark::schema::borrowable_update_t& value)
              -> field_diff_t {
            return diff_pubkeys(state.borrowable, value.value);
          },
          [&](const bulwark::schema::timelock_duration_update_t& value)
              -> field_diff_t {
            return duration_diff_t{.current = state.timelock_duration,
                                   .staged = value.value,
                                   .changed =
                                       value.value != state.timelock_duration};
          }},
      *staged);
}

bool is_empty(const field_diff_t& diff) {
  return std::visit(
      overloaded{[](const integration_acls_diff_t& value) {
                   return value.added.empty() && value.removed.empty() &&
                          value.modified.empty();
                 },
                 [](const delegate_acls_diff_t& value) {
                   return value.added.empty() && value.removed.empty() &&
                          value.modified.empty();
                 },
                 [](const pubkey_set_diff_t& value) {
                   return value.added.empty() && value.removed.empty();
                 },
                 [](const duration_diff_t& value) { return !value.changed; }},
      diff);
}

std::vector<std::string> render(const bulwark::schema::state_field_t field,
                                const field_diff_t& diff,
                                const bulwark::policy::registry& protocols) {
  auto name = bulwark::schema::to_string(field);
  if (is_empty(diff)) {
    return {fmt::format("  {}: No changes", name)};
  }

  auto lines = std::vector<std::string>{fmt::format("  {}:", name)};
  std::visit(
      overloaded{
          [&](const integration_acls_diff_t& value) {
            if (!value.added.empty()) {
              lines.emplace_back("    Added integrations:");
              for (const auto& acl : value.added) {
                lines.push_back(fmt::format(
                    "      [+] {} ({})",
                    bulwark::schema::short_key(acl.integration_program),
                    join(bulwark::policy::protocol_names(
                        protocols, acl.integration_program,
                        acl.protocols_bitmask))));
              }
            }
            if (!value.removed.empty()) {
              lines.emplace_back("    Removed integrations:");
              for (const auto& acl : value.removed) {
                lines.push_back(fmt::format(
                    "      [-] {} ({})",
                    bulwark::schema::short_key(acl.integration_program),
                    join(bulwark::policy::protocol_names(
                        protocols, acl.integration_program,
                        acl.protocols_bitmask))));
              }
            }
            if (!value.modified.empty()) {
              lines.emplace_back("    Modified integrations:");
              for (const auto& change : value.modified) {
                const auto& program = change.integration_program;
                lines.push_back(fmt::format(
                    "      [~] {}", bulwark::schema::short_key(program)));
                if (change.enabled_protocols != 0) {
                  lines.push_back(fmt::format(
                      "          Enabling: {}",
                      join(bulwark::policy::protocol_names(
                          protocols, program, change.enabled_protocols))));
                }
                if (change.disabled_protocols != 0) {
                  lines.push_back(fmt::format(
                      "          Disabling: {}",
                      join(bulwark::policy::protocol_names(
                          protocols, program, change.disabled_protocols))));
                }
                for (const auto& policy : change.policy_changes) {
                  lines.push_back(fmt::format(
                      "          Policy {}: {}",
                      protocol_label(protocols, program,
                                     policy.protocol_bitflag),
                      !policy.before ? "set"
                                     : (!policy.after ? "removed" : "changed")));
                  if (policy.slippage) {
                    lines.push_back(fmt::format(
                        "            Max slippage: {} bps -> {} bps",
                        policy.slippage->before, policy.slippage->after));
                  }
                  for (const auto& list : policy.allowlist_changes) {
                    lines.push_back(fmt::format("            {}:", list.title));
                    for (const auto& entry : list.added) {
                      lines.push_back(
                          fmt::format("              [+] {}", entry));
                    }
                    for (const auto& entry : list.removed) {
                      lines.push_back(
                          fmt::format("              [-] {}", entry));
                    }
                  }
                }
              }
            }
          },
          [&](const delegate_acls_diff_t& value) {
            if (!value.added.empty()) {
              lines.emplace_back("    Added delegates:");
              for (const auto& acl : value.added) {
                lines.push_back(fmt::format(
                    "      [+] {}", bulwark::schema::short_key(acl.pubkey)));
                lines.push_back(fmt::format("          Expires: {}",
                                            render_expiry(acl.expires_at)));
                for (const auto& integration : acl.integration_permissions) {
                  for (const auto& protocol : integration.protocol_permissions) {
                    lines.push_back(fmt::format(
                        "            {}: {}",
                        protocol_label(protocols,
                                       integration.integration_program,
                                       protocol.protocol_bitflag),
                        join(bulwark::policy::permission_names(
                            protocols, integration.integration_program,
                            protocol.protocol_bitflag,
                            protocol.permissions_bitmask))));
                  }
                }
              }
            }
            if (!value.removed.empty()) {
              lines.emplace_back("    Removed delegates:");
              for (const auto& acl : value.removed) {
                lines.push_back(fmt::format(
                    "      [-] {}", bulwark::schema::short_key(acl.pubkey)));
              }
            }
            if (!value.modified.empty()) {
              lines.emplace_back("    Modified delegates:");
              for (const auto& change : value.modified) {
                lines.push_back(fmt::format(
                    "      [~] {}", bulwark::schema::short_key(change.pubkey)));
                if (change.current_expires_at != change.staged_expires_at) {
                  lines.push_back(fmt::format(
                      "          Expiration: {} -> {}",
                      render_expiry(change.current_expires_at),
                      render_expiry(change.staged_expires_at)));
                }
                if (change.permission_changes.empty()) {
                  continue;
                }
                lines.emplace_back("          Permission changes:");
                for (const auto& permission : change.permission_changes) {
                  lines.push_back(fmt::format(
                      "            {}:",
                      protocol_label(protocols, permission.integration_program,
                                     permission.protocol_bitflag)));
                  if (permission.added != 0) {
                    lines.push_back(fmt::format(
                        "              Adding: {}",
                        join(bulwark::policy::permission_names(
                            protocols, permission.integration_program,
                            permission.protocol_bitflag, permission.added))));
                  }
                  if (permission.removed != 0) {
                    lines.push_back(fmt::format(
                        "              Removing: {}",
                        join(bulwark::policy::permission_names(
                            protocols, permission.integration_program,
                            permission.protocol_bitflag, permission.removed))));
                  }
                }
              }
            }
          },
          [&](const pubkey_set_diff_t& value) {
            for (const auto& key : value.added) {
              lines.push_back(
                  fmt::format("    [+] {}", bulwark::schema::to_base58(key)));
            }
            for (const auto& key : value.removed) {
              lines.push_back(
                  fmt::format("    [-] {}", bulwark::schema::to_base58(key)));
            }
          },
          [&](const duration_diff_t& value) {
            lines.push_back(fmt::format("    {}s -> {}s", value.current,
                                        value.staged));
          }},
      diff);
  return lines;
}

}  // namespace bulwark::timelock
