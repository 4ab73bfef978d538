#include <gtest/gtest.h>
#include <bulletin/schema/primitives.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = bulletin::schema::bytes_t(32, 0xAB);
  auto hash = bulletin::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, try_make_hash32_decodes_prefixed_hex) {
  auto hash = bulletin::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_digits) {
  EXPECT_FALSE(bulletin::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(bulletin::schema::try_make_hash32(std::string(64, 'z')).has_value());
  EXPECT_FALSE(bulletin::schema::try_from_hex("abc").has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = bulletin::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
  EXPECT_EQ(bulletin::schema::to_hex(zero), std::string(64, '0'));
}

TEST(primitives, string_and_byte_views_share_contents) {
  auto bytes = bulletin::schema::make_bytes(std::string_view{"View1"});
  EXPECT_EQ(bytes.size(), 5u);
  EXPECT_EQ(bulletin::schema::make_string(bytes), "View1");
  EXPECT_EQ(bulletin::schema::make_string_view(bytes), "View1");
  EXPECT_EQ(bulletin::schema::to_hex(bulletin::schema::make_bytes_view(bytes)),
            "5669657731");
}

TEST(primitives, genesis_rolling_hash_is_none) {
  EXPECT_EQ(bulletin::schema::kGenesisRollingHash, "None");
}
