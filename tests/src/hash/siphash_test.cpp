#include <bulletin/hash/siphash.hpp>
#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace {

std::string hash_hex(const std::string_view input) {
  auto hasher = bulletin::hash::siphash13{};
  hasher.update(input);
  return bulletin::hash::to_hex_string(hasher.finish());
}

}  // namespace

TEST(siphash13, matches_reference_vectors) {
  EXPECT_EQ(hash_hex(""), "d1fba762150c532c");
  EXPECT_EQ(hash_hex("abc"), "c03bc3a0042630f2");
  EXPECT_EQ(hash_hex("hello world"), "b1b1f2e707e4ac8a");
}

TEST(siphash13, reproduces_bulletin_chain_values) {
  EXPECT_EQ(hash_hex("View1None"), "6d8694a1e486efa9");
  EXPECT_EQ(hash_hex("View26d8694a1e486efa9"), "d9eecdcc19b3c6e5");
  EXPECT_EQ(hash_hex("ANone"), "30462bdc96678bf5");
  EXPECT_EQ(hash_hex("TestEqualViewsNone"), "4d569fe2c96fb965");
}

TEST(siphash13, incremental_updates_match_single_update) {
  auto split = bulletin::hash::siphash13{};
  split.update(std::string_view{"Test"})
      .update(std::string_view{"EqualViews"})
      .update(std::string_view{"None"});
  EXPECT_EQ(bulletin::hash::to_hex_string(split.finish()), "4d569fe2c96fb965");
}

TEST(siphash13, finish_does_not_reset_state) {
  auto hasher = bulletin::hash::siphash13{};
  hasher.update(std::string_view{"View"});
  const auto first = hasher.finish();
  EXPECT_EQ(hasher.finish(), first);
  hasher.update(std::string_view{"None"});
  EXPECT_EQ(bulletin::hash::to_hex_string(hasher.finish()), "1dbeac96f3abf89c");
}

TEST(siphash13, hex_rendering_is_not_zero_padded) {
  EXPECT_EQ(bulletin::hash::to_hex_string(0), "0");
  EXPECT_EQ(bulletin::hash::to_hex_string(0xab), "ab");
  EXPECT_EQ(bulletin::hash::to_hex_string(0x0102), "102");
}
