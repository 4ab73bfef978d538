#include <bulletin/ledger/commitment_store.hpp>
#include <bulletin/testing/common.hpp>
#include <gtest/gtest.h>

using namespace bulletin::schema;
using bulletin::testing::make_member;

namespace {

commitment_t make_commitment(const std::string_view view,
                             const std::string& rolling_hash) {
  return commitment_t{.view = make_bytes(view), .rolling_hash = rolling_hash};
}

}  // namespace

TEST(commitment_store, first_write_to_a_coordinate_wins) {
  auto store = bulletin::ledger::commitment_store{};
  const auto alice = make_member(1);
  store.register_member(alice);

  EXPECT_TRUE(store.try_insert(alice, 1, make_commitment("View1", "None")));
  EXPECT_FALSE(store.try_insert(alice, 1, make_commitment("Other", "None")));

  const auto stored = store.get(alice, 1);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(make_string(stored->view), "View1");
  EXPECT_EQ(store.size(), 1u);
}

TEST(commitment_store, unregistered_members_cannot_insert) {
  auto store = bulletin::ledger::commitment_store{};
  EXPECT_FALSE(store.try_insert(make_member(1), 1, make_commitment("A", "None")));
  EXPECT_EQ(store.find(make_member(1), 1), nullptr);
  EXPECT_EQ(store.size(), 0u);
}

TEST(commitment_store, collects_commitments_at_height_in_member_order) {
  auto store = bulletin::ledger::commitment_store{};
  const auto alice = make_member(1);
  const auto bob = make_member(2);
  const auto carol = make_member(3);
  for (const auto& member : {alice, bob, carol}) {
    store.register_member(member);
  }
  store.try_insert(carol, 4, make_commitment("C", "None"));
  store.try_insert(alice, 4, make_commitment("A", "None"));
  store.try_insert(bob, 5, make_commitment("B", "None"));

  const auto at_four = store.all_commitments_at(4, {alice, bob, carol});
  ASSERT_EQ(at_four.size(), 2u);
  EXPECT_EQ(make_string(at_four[0].view), "A");
  EXPECT_EQ(make_string(at_four[1].view), "C");
}

TEST(commitment_store, purge_forgets_member_and_its_commitments) {
  auto store = bulletin::ledger::commitment_store{};
  const auto alice = make_member(1);
  store.register_member(alice);
  store.try_insert(alice, 1, make_commitment("A", "None"));

  store.purge_member(alice);
  EXPECT_FALSE(store.get(alice, 1).has_value());
  EXPECT_FALSE(store.try_insert(alice, 2, make_commitment("B", "None")));

  store.register_member(alice);
  EXPECT_TRUE(store.try_insert(alice, 1, make_commitment("B", "None")));
}

TEST(commitment_store, export_and_import_preserve_records) {
  auto store = bulletin::ledger::commitment_store{};
  const auto alice = make_member(1);
  const auto bob = make_member(2);
  store.register_member(alice);
  store.register_member(bob);
  store.try_insert(alice, 1, make_commitment("A", "None"));
  store.try_insert(bob, -2, make_commitment("B", "None"));

  const auto records = store.export_records({alice, bob});
  ASSERT_EQ(records.size(), 2u);

  auto restored = bulletin::ledger::commitment_store{};
  restored.import_records({alice, bob}, records);
  EXPECT_EQ(restored.size(), 2u);
  EXPECT_EQ(restored.get(bob, -2), store.get(bob, -2));
}
