#include <bulwark/ledger/local_ledger.hpp>
#include <bulwark/schema/policy_error_code.hpp>
#include <bulwark/timelock/engine.hpp>
#include <bulwark/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using bulwark::schema::policy_error_code;
using bulwark::testing::make_pubkey;

class local_ledger_test : public ::testing::Test {
 protected:
  local_ledger_test()
      : db_path_{bulwark::testing::make_db_path("bulwark_local_ledger")} {}

  ~local_ledger_test() override { bulwark::testing::remove_path(db_path_); }

  std::string db_path_;
};

bulwark::schema::state_mutation_t assets_mutation(
    const bulwark::schema::vault_state_t& state,
    const bulwark::schema::pubkey_t& asset) {
  auto next = state;
  next.assets.push_back(asset);
  return bulwark::timelock::make_mutation(state, next);
}

}  // namespace

TEST_F(local_ledger_test, create_vault_is_idempotent_guarded) {
  auto ledger = bulwark::ledger::local_ledger{db_path_};
  auto vault = make_pubkey(1);
  EXPECT_FALSE(ledger.fetch_live_state(vault).has_value());

  EXPECT_TRUE(ledger.create_vault(vault).ok());
  auto again = ledger.create_vault(vault);
  EXPECT_TRUE(bulwark::schema::has_code(again, policy_error_code::vault_exists));

  auto state = ledger.fetch_live_state(vault);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->vault_id, vault);
  EXPECT_EQ(state->revision, 0u);
}

TEST_F(local_ledger_test, accepted_mutation_bumps_revision_and_logs) {
  auto vault = make_pubkey(2);
  {
    auto ledger = bulwark::ledger::local_ledger{db_path_};
    ASSERT_TRUE(ledger.create_vault(vault).ok());

    auto state = ledger.fetch_live_state(vault);
    ASSERT_TRUE(state.has_value());
    auto result = ledger.submit_mutation(assets_mutation(*state, make_pubkey(3)));
    ASSERT_TRUE(result.ok()) << result.log;
    ASSERT_TRUE(result.transaction_id.has_value());

    auto after = ledger.fetch_live_state(vault);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->revision, 1u);
    EXPECT_EQ(after->assets,
              (std::vector<bulwark::schema::pubkey_t>{make_pubkey(3)}));
  }

  // state and log survive reopening the database
  auto reopened = bulwark::ledger::local_ledger{db_path_};
  auto state = reopened.fetch_live_state(vault);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->revision, 1u);
  auto log = reopened.mutation_log(vault);
  ASSERT_EQ(log.size(), 1u);
  EXPECT_EQ(log[0].expected_revision, 0u);
  EXPECT_EQ(log[0].live_updates.size(), 1u);
}

TEST_F(local_ledger_test, stale_revision_is_rejected) {
  auto ledger = bulwark::ledger::local_ledger{db_path_};
  auto vault = make_pubkey(4);
  ASSERT_TRUE(ledger.create_vault(vault).ok());
  auto stale = ledger.fetch_live_state(vault);
  ASSERT_TRUE(stale.has_value());

  ASSERT_TRUE(ledger.submit_mutation(assets_mutation(*stale, make_pubkey(5)))
                  .ok());
  auto rejected =
      ledger.submit_mutation(assets_mutation(*stale, make_pubkey(6)));
  EXPECT_TRUE(bulwark::schema::has_code(
      rejected, policy_error_code::precondition_mismatch));
  EXPECT_EQ(rejected.info, "expected revision 0, current revision 1");

  auto state = ledger.fetch_live_state(vault);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->assets,
            (std::vector<bulwark::schema::pubkey_t>{make_pubkey(5)}));
  EXPECT_EQ(ledger.mutation_log(vault).size(), 1u);
}

TEST_F(local_ledger_test, unknown_vault_is_rejected) {
  auto ledger = bulwark::ledger::local_ledger{db_path_};
  auto mutation = bulwark::schema::state_mutation_t{};
  mutation.vault_id = make_pubkey(7);
  auto result = ledger.submit_mutation(mutation);
  EXPECT_TRUE(
      bulwark::schema::has_code(result, policy_error_code::vault_missing));
  EXPECT_EQ(result.codespace, "bulwark.ledger");
}

TEST_F(local_ledger_test, transaction_ids_differ_per_mutation) {
  auto ledger = bulwark::ledger::local_ledger{db_path_};
  auto vault = make_pubkey(8);
  ASSERT_TRUE(ledger.create_vault(vault).ok());

  auto first = ledger.submit_mutation(
      assets_mutation(*ledger.fetch_live_state(vault), make_pubkey(9)));
  auto second = ledger.submit_mutation(
      assets_mutation(*ledger.fetch_live_state(vault), make_pubkey(10)));
  ASSERT_TRUE(first.transaction_id.has_value());
  ASSERT_TRUE(second.transaction_id.has_value());
  EXPECT_NE(*first.transaction_id, *second.transaction_id);
}
