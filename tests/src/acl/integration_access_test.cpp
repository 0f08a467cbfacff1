#include <bulwark/acl/integration_access.hpp>
#include <bulwark/testing/common.hpp>
#include <gtest/gtest.h>

namespace {

using bulwark::schema::policy_error_code;
using bulwark::testing::make_pubkey;

const auto kProgram = make_pubkey(50);

}  // namespace

TEST(integration_access, enable_adds_entry_once) {
  auto acls = bulwark::acl::integration_acls_t{};
  EXPECT_FALSE(bulwark::acl::enable_integration(acls, kProgram, 0b011));
  ASSERT_EQ(acls.size(), 1u);
  EXPECT_EQ(acls[0].protocols_bitmask, 0b011);

  EXPECT_EQ(bulwark::acl::enable_integration(acls, kProgram, 0b100),
            policy_error_code::integration_already_enabled);
  EXPECT_EQ(acls[0].protocols_bitmask, 0b011);
}

TEST(integration_access, set_protocols_toggles_bits) {
  auto acls = bulwark::acl::integration_acls_t{};
  EXPECT_EQ(bulwark::acl::set_protocols(acls, kProgram, 0b1, true),
            policy_error_code::integration_not_enabled);

  bulwark::acl::enable_integration(acls, kProgram, 0b001);
  EXPECT_FALSE(bulwark::acl::set_protocols(acls, kProgram, 0b110, true));
  EXPECT_EQ(acls[0].protocols_bitmask, 0b111);
  EXPECT_FALSE(bulwark::acl::set_protocols(acls, kProgram, 0b010, false));
  EXPECT_EQ(acls[0].protocols_bitmask, 0b101);

  EXPECT_TRUE(bulwark::acl::is_protocol_enabled(acls, kProgram, 0b100));
  EXPECT_FALSE(bulwark::acl::is_protocol_enabled(acls, kProgram, 0b010));
  EXPECT_FALSE(bulwark::acl::is_protocol_enabled(acls, kProgram, 0));
}

TEST(integration_access, policies_require_enabled_protocol) {
  auto acls = bulwark::acl::integration_acls_t{};
  EXPECT_EQ(bulwark::acl::set_protocol_policy(acls, kProgram, 0b01, {1}),
            policy_error_code::integration_not_enabled);

  bulwark::acl::enable_integration(acls, kProgram, 0b01);
  EXPECT_EQ(bulwark::acl::set_protocol_policy(acls, kProgram, 0b10, {1}),
            policy_error_code::protocol_not_enabled);
  EXPECT_FALSE(bulwark::acl::set_protocol_policy(acls, kProgram, 0b01, {1}));
  EXPECT_FALSE(bulwark::acl::set_protocol_policy(acls, kProgram, 0b01, {2}));

  ASSERT_EQ(acls[0].protocol_policies.size(), 1u);
  EXPECT_EQ(bulwark::acl::find_policy(acls, kProgram, 0b01),
            (bulwark::schema::bytes_t{2}));
  EXPECT_FALSE(bulwark::acl::find_policy(acls, kProgram, 0b10).has_value());
}

TEST(integration_access, disable_keeps_dormant_policies) {
  auto acls = bulwark::acl::integration_acls_t{};
  EXPECT_EQ(bulwark::acl::disable_integration(acls, kProgram),
            policy_error_code::integration_not_enabled);

  bulwark::acl::enable_integration(acls, kProgram, 0b01);
  bulwark::acl::set_protocol_policy(acls, kProgram, 0b01, {7, 7});
  EXPECT_FALSE(bulwark::acl::disable_integration(acls, kProgram));

  auto entry = bulwark::acl::find_integration(acls, kProgram);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->protocols_bitmask, 0);
  EXPECT_FALSE(bulwark::acl::is_protocol_enabled(acls, kProgram, 0b01));
  EXPECT_EQ(bulwark::acl::find_policy(acls, kProgram, 0b01),
            (bulwark::schema::bytes_t{7, 7}));
}
