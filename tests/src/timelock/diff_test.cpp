#include <bulwark/acl/delegate_access.hpp>
#include <bulwark/acl/integration_access.hpp>
#include <bulwark/policy/protocol_policies.hpp>
#include <bulwark/policy/registry.hpp>
#include <bulwark/timelock/diff.hpp>
#include <bulwark/timelock/engine.hpp>
#include <bulwark/testing/common.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

namespace {

using bulwark::schema::state_field_t;
using bulwark::testing::make_pubkey;

bool contains_line(const std::vector<std::string>& lines,
                   const std::string& line) {
  return std::find(lines.begin(), lines.end(), line) != lines.end();
}

}  // namespace

TEST(timelock_diff, reordering_is_not_a_change) {
  auto current = std::vector<bulwark::schema::pubkey_t>{
      make_pubkey(1), make_pubkey(2), make_pubkey(3)};
  auto staged = std::vector<bulwark::schema::pubkey_t>{
      make_pubkey(3), make_pubkey(1), make_pubkey(2)};
  auto diff = bulwark::timelock::diff_pubkeys(current, staged);
  EXPECT_TRUE(diff.added.empty());
  EXPECT_TRUE(diff.removed.empty());

  auto a = bulwark::schema::delegate_acl_t{.pubkey = make_pubkey(4)};
  auto b = bulwark::schema::delegate_acl_t{.pubkey = make_pubkey(5)};
  auto delegates = bulwark::timelock::diff_delegate_acls({a, b}, {b, a});
  EXPECT_TRUE(bulwark::timelock::is_empty(delegates));
}

TEST(timelock_diff, pubkey_sets_report_both_directions) {
  auto diff = bulwark::timelock::diff_pubkeys(
      {make_pubkey(1), make_pubkey(2)}, {make_pubkey(2), make_pubkey(3)});
  EXPECT_EQ(diff.added,
            (std::vector<bulwark::schema::pubkey_t>{make_pubkey(3)}));
  EXPECT_EQ(diff.removed,
            (std::vector<bulwark::schema::pubkey_t>{make_pubkey(1)}));

  // swapping the inputs swaps the sides
  auto reverse = bulwark::timelock::diff_pubkeys(
      {make_pubkey(2), make_pubkey(3)}, {make_pubkey(1), make_pubkey(2)});
  EXPECT_EQ(reverse.added, diff.removed);
  EXPECT_EQ(reverse.removed, diff.added);
}

TEST(timelock_diff, delegate_permission_changes_are_per_protocol) {
  auto program = make_pubkey(9);
  auto current = bulwark::acl::delegate_acls_t{};
  bulwark::acl::grant(current, make_pubkey(4), program, 0b01, 0b0011);
  auto staged = current;
  bulwark::acl::revoke(staged, make_pubkey(4), program, 0b01, 0b0001);
  bulwark::acl::grant(staged, make_pubkey(4), program, 0b01, 0b0100);
  bulwark::acl::set_expiry(staged, make_pubkey(4), 777);

  auto diff = bulwark::timelock::diff_delegate_acls(current, staged);
  ASSERT_EQ(diff.modified.size(), 1u);
  const auto& change = diff.modified[0];
  EXPECT_EQ(change.current_expires_at, 0u);
  EXPECT_EQ(change.staged_expires_at, 777u);
  ASSERT_EQ(change.permission_changes.size(), 1u);
  EXPECT_EQ(change.permission_changes[0].added, 0b0100u);
  EXPECT_EQ(change.permission_changes[0].removed, 0b0001u);
}

TEST(timelock_diff, integration_changes_cover_bits_and_policies) {
  auto program = make_pubkey(9);
  auto current = bulwark::acl::integration_acls_t{};
  bulwark::acl::enable_integration(current, program, 0b011);
  bulwark::acl::set_protocol_policy(current, program, 0b01, {1});

  auto staged = current;
  bulwark::acl::set_protocols(staged, program, 0b010, false);
  bulwark::acl::set_protocols(staged, program, 0b100, true);
  bulwark::acl::set_protocol_policy(staged, program, 0b01, {2});
  bulwark::acl::enable_integration(staged, make_pubkey(10), 0b1);

  auto diff = bulwark::timelock::diff_integration_acls(
      current, staged, bulwark::policy::registry::standard());
  ASSERT_EQ(diff.added.size(), 1u);
  EXPECT_TRUE(diff.removed.empty());
  ASSERT_EQ(diff.modified.size(), 1u);
  EXPECT_EQ(diff.modified[0].enabled_protocols, 0b100);
  EXPECT_EQ(diff.modified[0].disabled_protocols, 0b010);
  ASSERT_EQ(diff.modified[0].policy_changes.size(), 1u);
  EXPECT_EQ(diff.modified[0].policy_changes[0].before,
            (bulwark::schema::bytes_t{1}));
  EXPECT_EQ(diff.modified[0].policy_changes[0].after,
            (bulwark::schema::bytes_t{2}));
}

TEST(timelock_diff, unstaged_field_has_empty_diff) {
  auto state = bulwark::schema::vault_state_t{};
  state.timelock_duration = 60;
  bulwark::timelock::stage(
      state, bulwark::schema::assets_update_t{{make_pubkey(1)}}, 0);

  for (const auto field : {state_field_t::integration_acls,
                           state_field_t::delegate_acls,
                           state_field_t::borrowable,
                           state_field_t::timelock_duration}) {
    EXPECT_TRUE(bulwark::timelock::is_empty(bulwark::timelock::diff(
        state, field, bulwark::policy::registry::standard())));
  }
  EXPECT_FALSE(bulwark::timelock::is_empty(bulwark::timelock::diff(
      state, state_field_t::assets, bulwark::policy::registry::standard())));

  ASSERT_FALSE(bulwark::timelock::cancel(state));
  EXPECT_TRUE(bulwark::timelock::is_empty(bulwark::timelock::diff(
      state, state_field_t::assets, bulwark::policy::registry::standard())));
}

TEST(timelock_diff, render_names_protocols_and_permissions) {
  const auto& registry = bulwark::policy::registry::standard();
  auto drift = registry.resolve_by_name("DriftProtocol");
  ASSERT_TRUE(drift.has_value());

  auto state = bulwark::schema::vault_state_t{};
  state.timelock_duration = 60;
  auto delegates = bulwark::acl::delegate_acls_t{};
  bulwark::acl::grant(delegates, make_pubkey(4), drift->integration_program,
                      drift->bitflag, (1u << 3u) | (1u << 4u));
  bulwark::timelock::stage(
      state, bulwark::schema::delegate_acls_update_t{delegates}, 0);

  auto lines = bulwark::timelock::render(
      state_field_t::delegate_acls,
      bulwark::timelock::diff(state, state_field_t::delegate_acls, registry),
      registry);
  EXPECT_EQ(lines.front(), "  delegateAcls:");
  EXPECT_TRUE(contains_line(lines, "    Added delegates:"));
  EXPECT_TRUE(contains_line(
      lines, "      [+] " + bulwark::schema::short_key(make_pubkey(4))));
  EXPECT_TRUE(contains_line(lines, "          Expires: never"));
  EXPECT_TRUE(contains_line(lines, "            DriftProtocol: Deposit, Withdraw"));

  auto unchanged = bulwark::timelock::render(
      state_field_t::assets,
      bulwark::timelock::diff(state, state_field_t::assets, registry),
      registry);
  EXPECT_EQ(unchanged, (std::vector<std::string>{"  assets: No changes"}));
}

TEST(timelock_diff, render_duration_change) {
  auto state = bulwark::schema::vault_state_t{};
  state.timelock_duration = 3600;
  bulwark::timelock::stage(
      state, bulwark::schema::timelock_duration_update_t{60}, 0);
  auto lines = bulwark::timelock::render(
      state_field_t::timelock_duration,
      bulwark::timelock::diff(state, state_field_t::timelock_duration,
                              bulwark::policy::registry::standard()),
      bulwark::policy::registry::standard());
  EXPECT_EQ(lines, (std::vector<std::string>{"  timelockDuration:",
                                             "    3600s -> 60s"}));
}

TEST(timelock_diff, reordered_policy_entries_are_not_a_change) {
  const auto& registry = bulwark::policy::registry::standard();
  auto drift = registry.resolve_by_name("DriftProtocol");
  ASSERT_TRUE(drift.has_value());

  auto live = bulwark::policy::drift_protocol_policy_t{};
  live.spot_markets = {2, 1};
  auto reordered = bulwark::policy::drift_protocol_policy_t{};
  reordered.spot_markets = {1, 2};
  ASSERT_NE(live.encode(), reordered.encode());

  auto current = bulwark::acl::integration_acls_t{};
  bulwark::acl::enable_integration(current, drift->integration_program,
                                   drift->bitflag);
  bulwark::acl::set_protocol_policy(current, drift->integration_program,
                                    drift->bitflag, live.encode());
  auto staged = current;
  bulwark::acl::set_protocol_policy(staged, drift->integration_program,
                                    drift->bitflag, reordered.encode());

  auto diff = bulwark::timelock::diff_integration_acls(current, staged,
                                                       registry);
  EXPECT_TRUE(bulwark::timelock::is_empty(diff));
}

TEST(timelock_diff, policy_changes_list_entries_per_allowlist) {
  const auto& registry = bulwark::policy::registry::standard();
  auto drift = registry.resolve_by_name("DriftProtocol");
  ASSERT_TRUE(drift.has_value());
  const auto& program = drift->integration_program;

  auto live = bulwark::policy::drift_protocol_policy_t{};
  live.spot_markets = {1, 2};
  auto next = live;
  next.spot_markets.remove(2);
  next.spot_markets.add(3);

  auto state = bulwark::schema::vault_state_t{};
  state.timelock_duration = 60;
  bulwark::acl::enable_integration(state.integration_acls, program,
                                   drift->bitflag);
  bulwark::acl::set_protocol_policy(state.integration_acls, program,
                                    drift->bitflag, live.encode());
  auto staged = state.integration_acls;
  bulwark::acl::set_protocol_policy(staged, program, drift->bitflag,
                                    next.encode());
  bulwark::timelock::stage(
      state, bulwark::schema::integration_acls_update_t{staged}, 0);

  auto diff = bulwark::timelock::diff(state, state_field_t::integration_acls,
                                      registry);
  const auto& modified =
      std::get<bulwark::timelock::integration_acls_diff_t>(diff).modified;
  ASSERT_EQ(modified.size(), 1u);
  ASSERT_EQ(modified[0].policy_changes.size(), 1u);
  const auto& policy = modified[0].policy_changes[0];
  ASSERT_EQ(policy.allowlist_changes.size(), 1u);
  EXPECT_EQ(policy.allowlist_changes[0].title, "Spot markets allowlist");
  EXPECT_EQ(policy.allowlist_changes[0].added,
            (std::vector<std::string>{"3"}));
  EXPECT_EQ(policy.allowlist_changes[0].removed,
            (std::vector<std::string>{"2"}));

  auto lines =
      bulwark::timelock::render(state_field_t::integration_acls, diff, registry);
  EXPECT_TRUE(contains_line(lines, "          Policy DriftProtocol: changed"));
  EXPECT_TRUE(contains_line(lines, "            Spot markets allowlist:"));
  EXPECT_TRUE(contains_line(lines, "              [+] 3"));
  EXPECT_TRUE(contains_line(lines, "              [-] 2"));
}

TEST(timelock_diff, new_policy_lists_its_entries) {
  const auto& registry = bulwark::policy::registry::standard();
  auto swap = registry.resolve_by_name("JupiterSwap");
  ASSERT_TRUE(swap.has_value());

  auto policy = bulwark::policy::jupiter_swap_policy_t{};
  policy.trailer.max_slippage_bps = 100;
  policy.allowed.add(make_pubkey(7));

  auto current = bulwark::acl::integration_acls_t{};
  bulwark::acl::enable_integration(current, swap->integration_program,
                                   swap->bitflag);
  auto staged = current;
  bulwark::acl::set_protocol_policy(staged, swap->integration_program,
                                    swap->bitflag, policy.encode());

  auto diff = bulwark::timelock::diff_integration_acls(current, staged,
                                                       registry);
  ASSERT_EQ(diff.modified.size(), 1u);
  ASSERT_EQ(diff.modified[0].policy_changes.size(), 1u);
  const auto& change = diff.modified[0].policy_changes[0];
  EXPECT_FALSE(change.before.has_value());
  ASSERT_TRUE(change.slippage.has_value());
  EXPECT_EQ(change.slippage->before, 50u);
  EXPECT_EQ(change.slippage->after, 100u);
  ASSERT_EQ(change.allowlist_changes.size(), 1u);
  EXPECT_EQ(change.allowlist_changes[0].added,
            (std::vector<std::string>{
                bulwark::schema::to_base58(make_pubkey(7))}));
}
