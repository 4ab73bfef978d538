#include <bulletin/ledger/membership_registry.hpp>
#include <bulletin/testing/common.hpp>
#include <gtest/gtest.h>

using bulletin::testing::make_member;

TEST(membership_registry, keeps_insertion_order_without_duplicates) {
  auto registry = bulletin::ledger::membership_registry{};
  EXPECT_TRUE(registry.add(make_member(3)));
  EXPECT_TRUE(registry.add(make_member(1)));
  EXPECT_FALSE(registry.add(make_member(3)));

  ASSERT_EQ(registry.size(), 2u);
  EXPECT_EQ(registry.members()[0], make_member(3));
  EXPECT_EQ(registry.members()[1], make_member(1));
}

TEST(membership_registry, remove_reports_absent_members) {
  auto registry = bulletin::ledger::membership_registry{};
  registry.add(make_member(1));
  EXPECT_FALSE(registry.remove(make_member(2)));
  EXPECT_TRUE(registry.remove(make_member(1)));
  EXPECT_FALSE(registry.contains(make_member(1)));
  EXPECT_EQ(registry.size(), 0u);
}

TEST(membership_registry, assign_replaces_whitelist) {
  auto registry = bulletin::ledger::membership_registry{};
  registry.add(make_member(1));
  registry.assign({make_member(5), make_member(6)});
  EXPECT_FALSE(registry.contains(make_member(1)));
  EXPECT_TRUE(registry.contains(make_member(6)));
  EXPECT_EQ(registry.size(), 2u);
}
