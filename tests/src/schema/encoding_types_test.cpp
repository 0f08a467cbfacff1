#include <bulwark/schema/encoding/scale/encoder.hpp>
#include <bulwark/schema/key/vault_state.hpp>
#include <bulwark/schema/state_mutation.hpp>
#include <bulwark/schema/vault_state.hpp>
#include <bulwark/testing/common.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <variant>

namespace {

using encoder_t = bulwark::schema::encoding::scale_encoder_t;
using bulwark::testing::make_hash;

bulwark::schema::vault_state_t make_populated_state() {
  auto state = bulwark::schema::vault_state_t{};
  state.vault_id = make_hash(1);
  state.revision = 7;
  state.integration_acls.push_back(bulwark::schema::integration_acl_t{
      .integration_program = make_hash(2),
      .protocols_bitmask = 0b101,
      .protocol_policies = {bulwark::schema::protocol_policy_t{
          .protocol_bitflag = 0b100, .data = {0, 0, 0, 0, 50, 0}}}});
  state.delegate_acls.push_back(bulwark::schema::delegate_acl_t{
      .pubkey = make_hash(3),
      .expires_at = 1'700'000'000,
      .integration_permissions = {bulwark::schema::integration_permissions_t{
          .integration_program = make_hash(2),
          .protocol_permissions = {bulwark::schema::protocol_permissions_t{
              .protocol_bitflag = 0b01, .permissions_bitmask = 0b11}}}}});
  state.assets = {make_hash(4), make_hash(5)};
  state.borrowable = {make_hash(6)};
  state.timelock_duration = 3600;
  state.pending.expires_at = 1'700'003'600;
  state.pending.updates.push_back(
      bulwark::schema::assets_update_t{{make_hash(4)}});
  state.pending.updates.push_back(
      bulwark::schema::timelock_duration_update_t{0});
  return state;
}

}  // namespace

TEST(encoding_types, vault_state_round_trips) {
  auto encoder = encoder_t{};
  auto state = make_populated_state();
  auto decoded = encoder.decode<bulwark::schema::vault_state_t>(
      bulwark::schema::make_bytes_view(encoder.encode(state)));

  EXPECT_EQ(decoded.vault_id, state.vault_id);
  EXPECT_EQ(decoded.revision, 7u);
  EXPECT_EQ(decoded.integration_acls, state.integration_acls);
  EXPECT_EQ(decoded.delegate_acls, state.delegate_acls);
  EXPECT_EQ(decoded.assets, state.assets);
  EXPECT_EQ(decoded.borrowable, state.borrowable);
  EXPECT_EQ(decoded.timelock_duration, 3600u);
  EXPECT_EQ(decoded.pending, state.pending);
}

TEST(encoding_types, state_mutation_keeps_pending_presence) {
  auto encoder = encoder_t{};
  auto mutation = bulwark::schema::state_mutation_t{};
  mutation.vault_id = make_hash(9);
  mutation.expected_revision = 3;
  mutation.live_updates.push_back(
      bulwark::schema::borrowable_update_t{{make_hash(10)}});

  auto without_pending = encoder.decode<bulwark::schema::state_mutation_t>(
      bulwark::schema::make_bytes_view(encoder.encode(mutation)));
  EXPECT_FALSE(without_pending.pending.has_value());
  ASSERT_EQ(without_pending.live_updates.size(), 1u);
  EXPECT_EQ(bulwark::schema::field_of(without_pending.live_updates[0]),
            bulwark::schema::state_field_t::borrowable);

  mutation.pending = bulwark::schema::pending_state_t{};
  auto with_pending = encoder.decode<bulwark::schema::state_mutation_t>(
      bulwark::schema::make_bytes_view(encoder.encode(mutation)));
  ASSERT_TRUE(with_pending.pending.has_value());
  EXPECT_TRUE(with_pending.pending->updates.empty());
}

TEST(encoding_types, try_decode_rejects_truncated_bytes) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(make_populated_state());
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder.try_decode<bulwark::schema::vault_state_t>(
                          bulwark::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(encoding_types, vault_keys_share_prefixes) {
  auto encoder = encoder_t{};
  auto vault = make_hash(11);
  auto state_key = bulwark::schema::key::make_vault_state_key(encoder, vault);
  auto prefix = bulwark::schema::key::make_vault_log_prefix(encoder, vault);
  auto first = bulwark::schema::key::make_vault_log_key(encoder, vault, 1);
  auto second = bulwark::schema::key::make_vault_log_key(encoder, vault, 256);

  auto state_prefix =
      bulwark::schema::make_bytes(bulwark::schema::key::kVaultStatePrefix);
  EXPECT_TRUE(std::equal(state_prefix.begin(), state_prefix.end(),
                         state_key.begin()));
  EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), first.begin()));
  EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), second.begin()));
  EXPECT_EQ(first.size(), prefix.size() + sizeof(uint64_t));
  // big endian revisions sort numerically
  EXPECT_TRUE(first < second);
}
