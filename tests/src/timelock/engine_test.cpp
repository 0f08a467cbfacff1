#include <bulwark/timelock/engine.hpp>
#include <bulwark/testing/common.hpp>
#include <gtest/gtest.h>

#include <variant>

namespace {

using bulwark::schema::policy_error_code;
using bulwark::schema::state_field_t;
using bulwark::testing::make_pubkey;
using bulwark::timelock::timelock_status_t;

bulwark::schema::vault_state_t make_state(
    const bulwark::schema::duration_seconds_t duration) {
  auto state = bulwark::schema::vault_state_t{};
  state.vault_id = make_pubkey(1);
  state.timelock_duration = duration;
  state.assets = {make_pubkey(2)};
  return state;
}

}  // namespace

TEST(timelock_engine, zero_duration_writes_live) {
  auto state = make_state(0);
  bulwark::timelock::submit(
      state, bulwark::schema::assets_update_t{{make_pubkey(3)}}, 100);
  EXPECT_EQ(state.assets, (std::vector<bulwark::schema::pubkey_t>{make_pubkey(3)}));
  EXPECT_TRUE(state.pending.updates.empty());
  EXPECT_EQ(bulwark::timelock::status(state, 100), timelock_status_t::idle);
}

TEST(timelock_engine, unchanged_value_is_not_staged) {
  auto state = make_state(3600);
  bulwark::timelock::submit(
      state, bulwark::schema::assets_update_t{{make_pubkey(2)}}, 1000);
  EXPECT_TRUE(state.pending.updates.empty());
  EXPECT_EQ(state.pending.expires_at, 0u);
  EXPECT_EQ(bulwark::timelock::status(state, 1000), timelock_status_t::idle);
}

TEST(timelock_engine, later_stages_do_not_reset_the_clock) {
  auto state = make_state(3600);
  bulwark::timelock::submit(
      state, bulwark::schema::assets_update_t{{make_pubkey(3)}}, 1000);
  EXPECT_EQ(state.pending.expires_at, 4600u);
  EXPECT_EQ(state.assets, (std::vector<bulwark::schema::pubkey_t>{make_pubkey(2)}));

  bulwark::timelock::submit(
      state, bulwark::schema::borrowable_update_t{{make_pubkey(4)}}, 2000);
  EXPECT_EQ(state.pending.expires_at, 4600u);
  EXPECT_EQ(state.pending.updates.size(), 2u);
  EXPECT_EQ(bulwark::timelock::status(state, 2000), timelock_status_t::staged);
  EXPECT_EQ(bulwark::timelock::remaining_seconds(state, 2000), 2600u);
}

TEST(timelock_engine, last_stage_per_field_wins) {
  auto state = make_state(60);
  bulwark::timelock::stage(
      state, bulwark::schema::timelock_duration_update_t{10}, 0);
  bulwark::timelock::stage(
      state, bulwark::schema::assets_update_t{{make_pubkey(5)}}, 0);
  bulwark::timelock::stage(
      state, bulwark::schema::assets_update_t{{make_pubkey(6)}}, 0);

  ASSERT_EQ(state.pending.updates.size(), 2u);
  // ordered by field
  EXPECT_EQ(bulwark::schema::field_of(state.pending.updates[0]),
            state_field_t::assets);
  EXPECT_EQ(bulwark::schema::field_of(state.pending.updates[1]),
            state_field_t::timelock_duration);

  auto staged = bulwark::timelock::staged_value(state, state_field_t::assets);
  ASSERT_TRUE(staged.has_value());
  EXPECT_EQ(std::get<bulwark::schema::assets_update_t>(*staged).value,
            (std::vector<bulwark::schema::pubkey_t>{make_pubkey(6)}));
}

TEST(timelock_engine, projected_prefers_staged_value) {
  auto state = make_state(60);
  auto live = bulwark::timelock::projected(state, state_field_t::assets);
  EXPECT_EQ(std::get<bulwark::schema::assets_update_t>(live).value,
            state.assets);

  bulwark::timelock::stage(
      state, bulwark::schema::assets_update_t{{make_pubkey(7)}}, 0);
  auto staged = bulwark::timelock::projected(state, state_field_t::assets);
  EXPECT_EQ(std::get<bulwark::schema::assets_update_t>(staged).value,
            (std::vector<bulwark::schema::pubkey_t>{make_pubkey(7)}));
}

TEST(timelock_engine, apply_waits_for_expiry) {
  auto state = make_state(3600);
  bulwark::timelock::submit(
      state, bulwark::schema::assets_update_t{{make_pubkey(3)}}, 1000);
  bulwark::timelock::submit(
      state, bulwark::schema::timelock_duration_update_t{0}, 1500);

  EXPECT_EQ(bulwark::timelock::apply(state, 4599),
            policy_error_code::timelock_not_expired);
  EXPECT_EQ(state.assets, (std::vector<bulwark::schema::pubkey_t>{make_pubkey(2)}));

  EXPECT_EQ(bulwark::timelock::status(state, 4600), timelock_status_t::ready);
  EXPECT_EQ(bulwark::timelock::remaining_seconds(state, 4600), 0u);
  EXPECT_FALSE(bulwark::timelock::apply(state, 4600));
  EXPECT_EQ(state.assets, (std::vector<bulwark::schema::pubkey_t>{make_pubkey(3)}));
  EXPECT_EQ(state.timelock_duration, 0u);
  EXPECT_EQ(state.pending, bulwark::schema::pending_state_t{});

  EXPECT_EQ(bulwark::timelock::apply(state, 9999),
            policy_error_code::nothing_staged);
}

TEST(timelock_engine, cancel_discards_queue_only) {
  auto state = make_state(3600);
  auto original = state;
  bulwark::timelock::submit(
      state, bulwark::schema::assets_update_t{{make_pubkey(3)}}, 1000);
  EXPECT_FALSE(bulwark::timelock::cancel(state));

  EXPECT_EQ(state.assets, original.assets);
  EXPECT_EQ(state.borrowable, original.borrowable);
  EXPECT_EQ(state.timelock_duration, original.timelock_duration);
  EXPECT_EQ(state.pending, original.pending);
  EXPECT_EQ(bulwark::timelock::cancel(state),
            policy_error_code::nothing_staged);
}

TEST(timelock_engine, restaging_after_apply_starts_a_new_clock) {
  auto state = make_state(100);
  bulwark::timelock::submit(
      state, bulwark::schema::assets_update_t{{make_pubkey(3)}}, 0);
  ASSERT_FALSE(bulwark::timelock::apply(state, 100));

  bulwark::timelock::submit(
      state, bulwark::schema::assets_update_t{{make_pubkey(4)}}, 500);
  EXPECT_EQ(state.pending.expires_at, 600u);
}

TEST(timelock_engine, mutation_carries_changed_fields_only) {
  auto before = make_state(3600);
  before.revision = 4;
  auto after = before;
  bulwark::timelock::submit(
      after, bulwark::schema::assets_update_t{{make_pubkey(8)}}, 10);

  auto staged = bulwark::timelock::make_mutation(before, after);
  EXPECT_EQ(staged.vault_id, before.vault_id);
  EXPECT_EQ(staged.expected_revision, 4u);
  EXPECT_TRUE(staged.live_updates.empty());
  ASSERT_TRUE(staged.pending.has_value());

  auto live = before;
  live.timelock_duration = 0;
  live.borrowable = {make_pubkey(9)};
  auto direct = bulwark::timelock::make_mutation(before, live);
  EXPECT_FALSE(direct.pending.has_value());
  ASSERT_EQ(direct.live_updates.size(), 2u);
  EXPECT_EQ(bulwark::schema::field_of(direct.live_updates[0]),
            state_field_t::borrowable);
  EXPECT_EQ(bulwark::schema::field_of(direct.live_updates[1]),
            state_field_t::timelock_duration);

  auto replayed = before;
  bulwark::timelock::apply_mutation(replayed, direct);
  EXPECT_EQ(replayed.borrowable, live.borrowable);
  EXPECT_EQ(replayed.timelock_duration, 0u);
  EXPECT_EQ(replayed.revision, 4u);
}
