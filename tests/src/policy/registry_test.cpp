#include <bulwark/blake3/hash.hpp>
#include <bulwark/policy/registry.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(registry, standard_table_resolves_by_name_ignoring_case) {
  const auto& registry = bulwark::policy::registry::standard();
  auto swap = registry.resolve_by_name("jupiterswap");
  ASSERT_TRUE(swap.has_value());
  EXPECT_EQ(swap->name, "JupiterSwap");
  EXPECT_EQ(swap->integration, "glamProtocol");
  EXPECT_EQ(swap->bitflag, 0b100);
  EXPECT_EQ(swap->schema, bulwark::policy::policy_schema_t::jupiter_swap);

  EXPECT_FALSE(registry.resolve_by_name("Uniswap").has_value());
}

TEST(registry, resolve_by_program_and_bitflag) {
  const auto& registry = bulwark::policy::registry::standard();
  auto kamino = registry.resolve_integration("kamino");
  ASSERT_TRUE(kamino.has_value());

  auto farms = registry.resolve(*kamino, 0b100);
  ASSERT_TRUE(farms.has_value());
  EXPECT_EQ(farms->name, "KaminoFarms");
  EXPECT_FALSE(registry.resolve(*kamino, 0b1000).has_value());
  EXPECT_EQ(registry.all_protocols(*kamino), 0b111);
  EXPECT_EQ(registry.protocols_of(*kamino).size(), 3u);
}

TEST(registry, program_ids_are_derived_and_distinct) {
  const auto& registry = bulwark::policy::registry::standard();
  auto drift = registry.resolve_integration("drift");
  ASSERT_TRUE(drift.has_value());
  EXPECT_EQ(*drift, bulwark::policy::derive_program_id("drift"));
  EXPECT_EQ(*drift, bulwark::blake3::hash(
                        std::string_view{"bulwark/integration/drift"}));
  EXPECT_NE(*drift, bulwark::policy::derive_program_id("kamino"));

  // program keys resolve as well as names
  auto by_key =
      registry.resolve_integration(bulwark::schema::to_base58(*drift));
  ASSERT_TRUE(by_key.has_value());
  EXPECT_EQ(*by_key, *drift);
  EXPECT_EQ(registry.integration_name(*drift), "drift");

  auto stranger = bulwark::policy::derive_program_id("stranger");
  EXPECT_FALSE(registry.resolve_integration(bulwark::schema::to_base58(stranger))
                   .has_value());
  EXPECT_EQ(registry.integrations().size(), 5u);
}

TEST(registry, permission_mask_unions_named_bits) {
  const auto& registry = bulwark::policy::registry::standard();
  auto drift = registry.resolve_by_name("DriftProtocol");
  ASSERT_TRUE(drift.has_value());

  auto mask = registry.permission_mask(
      *drift, std::vector<std::string>{"Deposit", "withdraw"});
  ASSERT_TRUE(mask.has_value());
  EXPECT_EQ(*mask, (1u << 3u) | (1u << 4u));

  EXPECT_FALSE(registry
                   .permission_mask(*drift, std::vector<std::string>{
                                                "Deposit", "Teleport"})
                   .has_value());
  EXPECT_EQ(registry.permission_mask(*drift, {}), 0u);
}

TEST(registry, empty_allowlist_semantics_per_protocol) {
  const auto& registry = bulwark::policy::registry::standard();
  EXPECT_EQ(registry.resolve_by_name("SplToken")->empty_allowlist,
            bulwark::policy::empty_allowlist_t::deny_all);
  EXPECT_EQ(registry.resolve_by_name("CCTP")->empty_allowlist,
            bulwark::policy::empty_allowlist_t::deny_all);
  EXPECT_EQ(registry.resolve_by_name("JupiterSwap")->empty_allowlist,
            bulwark::policy::empty_allowlist_t::unrestricted);
  EXPECT_EQ(registry.resolve_by_name("DriftVaults")->empty_allowlist,
            bulwark::policy::empty_allowlist_t::unrestricted);
}

TEST(registry, custom_tables_collect_integrations) {
  auto program = bulwark::policy::derive_program_id("custom");
  auto registry = bulwark::policy::registry{{
      bulwark::policy::protocol_descriptor_t{
          .integration = "custom",
          .integration_program = program,
          .name = "First",
          .bitflag = 0b01,
          .permissions = {{0, "Use"}}},
      bulwark::policy::protocol_descriptor_t{
          .integration = "custom",
          .integration_program = program,
          .name = "Second",
          .bitflag = 0b10,
          .permissions = {{0, "Use"}}},
  }};
  EXPECT_EQ(registry.integrations().size(), 1u);
  EXPECT_EQ(registry.all_protocols(program), 0b11);
  EXPECT_EQ(registry.resolve(program, 0b10)->permission_name(0), "Use");
  EXPECT_FALSE(registry.resolve(program, 0b10)->permission_name(1));
}
