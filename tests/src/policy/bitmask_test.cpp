#include <bulwark/policy/bitmask.hpp>
#include <bulwark/policy/registry.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

TEST(bitmask, make_bit_respects_mask_width) {
  EXPECT_EQ(bulwark::policy::make_bit<uint16_t>(0), uint16_t{1});
  EXPECT_EQ(bulwark::policy::make_bit<uint16_t>(15), uint16_t{0x8000});
  EXPECT_FALSE(bulwark::policy::make_bit<uint16_t>(16).has_value());
  EXPECT_EQ(bulwark::policy::make_bit<uint64_t>(63),
            uint64_t{1} << 63u);
  EXPECT_FALSE(bulwark::policy::make_bit<uint64_t>(64).has_value());
}

TEST(bitmask, ordinal_of_requires_single_bit) {
  EXPECT_EQ(bulwark::policy::ordinal_of<uint16_t>(0b100), uint8_t{2});
  EXPECT_FALSE(bulwark::policy::ordinal_of<uint16_t>(0).has_value());
  EXPECT_FALSE(bulwark::policy::ordinal_of<uint16_t>(0b110).has_value());
}

TEST(bitmask, set_bits_walks_lowest_first) {
  auto ordinals = std::vector<uint8_t>{};
  for (const auto ordinal : bulwark::policy::set_bits<uint64_t>(0b1010'0101)) {
    ordinals.push_back(ordinal);
  }
  EXPECT_EQ(ordinals, (std::vector<uint8_t>{0, 2, 5, 7}));

  auto range = bulwark::policy::set_bits<uint16_t>(0);
  EXPECT_TRUE(range.empty());
  EXPECT_EQ(range.size(), 0u);
  EXPECT_EQ(range.begin(), range.end());
}

TEST(bitmask, set_flags_splits_mask) {
  EXPECT_EQ(bulwark::policy::set_flags<uint16_t>(0b1011),
            (std::vector<uint16_t>{0b0001, 0b0010, 0b1000}));
  EXPECT_TRUE(bulwark::policy::set_flags<uint16_t>(0).empty());
}

TEST(bitmask, format_bits_pads_to_width) {
  EXPECT_EQ(bulwark::policy::format_bits(5, 8), "00000101");
  EXPECT_EQ(bulwark::policy::format_bits(0, 4), "0000");
  EXPECT_EQ(bulwark::policy::format_bits(0b11, 16), "0000000000000011");
  // wider than the requested width is never truncated
  EXPECT_EQ(bulwark::policy::format_bits(0b10001, 2), "10001");
}

TEST(bitmask, names_resolve_through_registry) {
  const auto& registry = bulwark::policy::registry::standard();
  auto drift = registry.resolve_integration("drift");
  ASSERT_TRUE(drift.has_value());

  EXPECT_EQ(bulwark::policy::protocol_names(registry, *drift, 0b11),
            (std::vector<std::string>{"DriftProtocol", "DriftVaults"}));
  EXPECT_EQ(bulwark::policy::protocol_names(registry, *drift, 0b100),
            (std::vector<std::string>{"4"}));

  EXPECT_EQ(bulwark::policy::permission_names(registry, *drift, 0b01,
                                              (1u << 3u) | (1u << 4u)),
            (std::vector<std::string>{"Deposit", "Withdraw"}));
  EXPECT_EQ(bulwark::policy::permission_names(registry, *drift, 0b01,
                                              uint64_t{1} << 20u),
            (std::vector<std::string>{"1048576"}));
}
