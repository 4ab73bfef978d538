#include <bulletin/execution/engine.hpp>
#include <bulletin/testing/common.hpp>
#include <bulletin/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using namespace bulletin::schema;
using bulletin::testing::count_events;
using bulletin::testing::engine_fixture;
using bulletin::testing::make_member;

TEST(engine_approval, replies_collected_before_publish_approve_the_view) {
  auto fixture = engine_fixture{3};
  auto& engine = fixture.engine();
  ASSERT_TRUE(engine.open_replies(fixture.owner(), 1, fixture.member(0)).ok());

  EXPECT_TRUE(fixture.evaluate(1, 1, 0, "OK").ok());
  EXPECT_TRUE(fixture.evaluate(2, 1, 0, "OK").ok());
  EXPECT_FALSE(engine.commitment(fixture.member(0), 1).has_value());

  const auto result = fixture.publish(0, 1, "View", "None");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(count_events<view_published_t>(result.events), 1u);
  EXPECT_EQ(engine.commitment(fixture.member(0), 1),
            (commitment_t{.view = make_bytes(std::string_view{"View"}),
                          .rolling_hash = "None"}));
  EXPECT_FALSE(engine.replies(fixture.member(0), 1).has_value());
}

TEST(engine_approval, approval_and_disapproval_reject_the_view) {
  auto fixture = engine_fixture{3};
  auto& engine = fixture.engine();
  engine.open_replies(fixture.owner(), 1, fixture.member(0));
  fixture.evaluate(1, 1, 0, "OK");
  fixture.evaluate(2, 1, 0, "NOK");

  const auto result = fixture.publish(0, 1, "View", "None");
  EXPECT_TRUE(result.is(bulletin_error_code::quorum_rejected));
  EXPECT_FALSE(engine.commitment(fixture.member(0), 1).has_value());

  ASSERT_EQ(count_events<view_conflict_t>(result.events), 1u);
  const auto& conflict = std::get<view_conflict_t>(result.events.back());
  EXPECT_EQ(conflict.member, fixture.member(0));
  EXPECT_EQ(conflict.rolling_hash, "None");

  // Rejected replies stay for audit; the round itself is closed.
  EXPECT_EQ(engine.replies(fixture.member(0), 1),
            (std::vector<std::string>{"OK", "NOK"}));
  EXPECT_FALSE(engine.pending_round(fixture.member(0), 1).has_value());
}

TEST(engine_approval, kept_rejections_count_against_a_retry) {
  auto fixture = engine_fixture{3};
  fixture.publish(0, 1, "View", "None");
  fixture.evaluate(1, 1, 0, "NOK");
  fixture.evaluate(2, 1, 0, "OK");
  EXPECT_FALSE(fixture.engine().commitment(fixture.member(0), 1).has_value());

  EXPECT_TRUE(fixture.publish(0, 1, "Retry", "None")
                  .is(bulletin_error_code::quorum_rejected));
}

TEST(engine_approval, reopened_coordinate_can_be_approved) {
  auto fixture = engine_fixture{3};
  auto& engine = fixture.engine();
  fixture.publish(0, 1, "View", "None");
  fixture.evaluate(1, 1, 0, "NOK");
  fixture.evaluate(2, 1, 0, "OK");
  ASSERT_EQ(engine.replies(fixture.member(0), 1),
            (std::vector<std::string>{"NOK", "OK"}));

  ASSERT_TRUE(engine.open_replies(fixture.owner(), 1, fixture.member(0)).ok());
  EXPECT_EQ(engine.replies(fixture.member(0), 1),
            (std::vector<std::string>{}));

  EXPECT_TRUE(fixture.evaluate(1, 1, 0, "OK").ok());
  EXPECT_TRUE(fixture.evaluate(2, 1, 0, "OK").ok());
  const auto result = fixture.publish(0, 1, "View", "None");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(count_events<view_published_t>(result.events), 1u);
  EXPECT_TRUE(engine.commitment(fixture.member(0), 1).has_value());
}

TEST(engine_approval, open_replies_leaves_a_suspended_round_alone) {
  auto fixture = engine_fixture{3};
  auto& engine = fixture.engine();
  fixture.publish(0, 1, "View", "None");
  fixture.evaluate(1, 1, 0, "OK");

  EXPECT_TRUE(engine.open_replies(fixture.owner(), 1, fixture.member(0))
                  .is(bulletin_error_code::round_in_progress));
  EXPECT_EQ(engine.replies(fixture.member(0), 1),
            (std::vector<std::string>{"OK"}));
  EXPECT_TRUE(engine.pending_round(fixture.member(0), 1).has_value());
}

TEST(engine_approval, evaluation_settles_a_suspended_round) {
  auto fixture = engine_fixture{3};
  auto& engine = fixture.engine();
  const auto pending = fixture.publish(0, 1, "View", "None");
  EXPECT_TRUE(pending.is(bulletin_error_code::approval_pending));
  ASSERT_EQ(pending.events.size(), 1u);
  const auto& request = std::get<view_approval_request_t>(pending.events[0]);
  EXPECT_EQ(request.member, fixture.member(0));
  EXPECT_EQ(request.rolling_hash, "None");

  auto result = fixture.evaluate(1, 1, 0, "OK");
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.info, "awaiting_replies");
  EXPECT_TRUE(result.events.empty());

  result = fixture.evaluate(2, 1, 0, "OK");
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.codespace, "bulletin.evaluate");
  EXPECT_EQ(result.info, "approved");
  ASSERT_EQ(count_events<view_published_t>(result.events), 1u);
  EXPECT_TRUE(engine.commitment(fixture.member(0), 1).has_value());
  EXPECT_FALSE(engine.pending_round(fixture.member(0), 1).has_value());
}

TEST(engine_approval, evaluation_rejection_reports_the_proposer) {
  auto fixture = engine_fixture{3};
  fixture.publish(0, 1, "View", "None");
  fixture.evaluate(1, 1, 0, "OK");
  const auto result = fixture.evaluate(2, 1, 0, "NOK");
  EXPECT_EQ(result.info, "rejected");
  ASSERT_EQ(count_events<view_conflict_t>(result.events), 1u);
  EXPECT_EQ(std::get<view_conflict_t>(result.events[0]).member,
            fixture.member(0));
  EXPECT_FALSE(fixture.engine().commitment(fixture.member(0), 1).has_value());
}

TEST(engine_approval, approved_round_with_stale_hash_is_dropped) {
  auto fixture = engine_fixture{3};
  fixture.publish(0, 1, "View", "NotTheChain");
  fixture.evaluate(1, 1, 0, "OK");
  const auto result = fixture.evaluate(2, 1, 0, "OK");
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.info, "approved");
  EXPECT_TRUE(result.events.empty());
  EXPECT_FALSE(fixture.engine().commitment(fixture.member(0), 1).has_value());
}

TEST(engine_approval, every_reply_counts) {
  auto fixture = engine_fixture{3};
  fixture.publish(0, 1, "View", "None");
  fixture.evaluate(1, 1, 0, "OK");
  const auto result = fixture.evaluate(1, 1, 0, "OK");
  EXPECT_EQ(result.info, "approved");
  EXPECT_TRUE(fixture.engine().commitment(fixture.member(0), 1).has_value());
}

TEST(engine_approval, evaluation_requires_membership_and_open_collection) {
  auto fixture = engine_fixture{3};
  auto& engine = fixture.engine();

  auto result = fixture.evaluate(1, 1, 0, "OK");
  EXPECT_TRUE(result.is(bulletin_error_code::no_open_round));

  fixture.publish(0, 1, "View", "None");
  result = engine.evaluate_view(make_member(80), 1, fixture.member(0), "OK");
  EXPECT_TRUE(result.is(bulletin_error_code::unauthorized));
  EXPECT_EQ(engine.replies(fixture.member(0), 1),
            (std::vector<std::string>{}));
}

TEST(engine_approval, open_replies_is_owner_only) {
  auto fixture = engine_fixture{2};
  auto& engine = fixture.engine();
  EXPECT_TRUE(engine.open_replies(fixture.member(1), 1, fixture.member(0))
                  .is(bulletin_error_code::unauthorized));
  EXPECT_TRUE(engine.open_replies(fixture.owner(), 1, make_member(70))
                  .is(bulletin_error_code::member_missing));
  EXPECT_FALSE(engine.replies(fixture.member(0), 1).has_value());
}

TEST(engine_approval, timeout_expires_before_publish) {
  auto fixture = engine_fixture{2, 0};
  auto& engine = fixture.engine();
  engine.open_replies(fixture.owner(), 1, fixture.member(0));
  engine.increment_clock(fixture.owner());
  engine.increment_clock(fixture.owner());

  const auto result = fixture.publish(0, 1, "View", "None");
  EXPECT_TRUE(result.is(bulletin_error_code::quorum_timeout));
  EXPECT_FALSE(engine.commitment(fixture.member(0), 1).has_value());
  EXPECT_FALSE(engine.replies(fixture.member(0), 1).has_value());
  EXPECT_EQ(count_events<view_conflict_t>(result.events), 0u);
}

TEST(engine_approval, clock_ticks_expire_suspended_rounds) {
  auto fixture = engine_fixture{3, 2};
  auto& engine = fixture.engine();
  fixture.publish(0, 1, "View", "None");
  fixture.evaluate(1, 1, 0, "OK");

  auto result = engine.increment_clock(fixture.owner());
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.codespace, "bulletin.clock");
  EXPECT_TRUE(engine.pending_round(fixture.member(0), 1).has_value());

  fixture.clear_events();
  result = engine.increment_clock(fixture.owner());
  EXPECT_TRUE(result.ok());
  EXPECT_TRUE(result.events.empty());
  EXPECT_TRUE(fixture.events().empty());
  EXPECT_FALSE(engine.pending_round(fixture.member(0), 1).has_value());
  EXPECT_FALSE(engine.replies(fixture.member(0), 1).has_value());
  EXPECT_FALSE(engine.commitment(fixture.member(0), 1).has_value());

  // A fresh round can start once the old one expired.
  EXPECT_TRUE(fixture.publish(0, 1, "View", "None")
                  .is(bulletin_error_code::approval_pending));
  const auto round = engine.pending_round(fixture.member(0), 1);
  ASSERT_TRUE(round.has_value());
  EXPECT_EQ(round->initial_clock, 2u);
}

TEST(engine_approval, timeout_changes_apply_to_pending_rounds) {
  auto fixture = engine_fixture{3, 100};
  auto& engine = fixture.engine();
  fixture.publish(0, 1, "View", "None");
  engine.increment_clock(fixture.owner());
  ASSERT_TRUE(engine.pending_round(fixture.member(0), 1).has_value());

  EXPECT_TRUE(engine.set_timeout(fixture.owner(), 1).ok());
  EXPECT_EQ(engine.timeout(), 1u);
  engine.increment_clock(fixture.owner());
  EXPECT_FALSE(engine.pending_round(fixture.member(0), 1).has_value());
}

TEST(engine_approval, clock_and_timeout_are_owner_only) {
  auto fixture = engine_fixture{1};
  auto& engine = fixture.engine();
  EXPECT_EQ(engine.clock(), 0u);
  EXPECT_TRUE(engine.increment_clock(fixture.owner()).ok());
  EXPECT_EQ(engine.clock(), 1u);

  EXPECT_TRUE(engine.increment_clock(fixture.member(0))
                  .is(bulletin_error_code::unauthorized));
  EXPECT_TRUE(engine.set_timeout(fixture.member(0), 5)
                  .is(bulletin_error_code::unauthorized));
  EXPECT_EQ(engine.clock(), 1u);
  EXPECT_EQ(engine.timeout(), 10u);
}

TEST(engine_approval, clock_stops_at_its_maximum) {
  auto fixture = engine_fixture{2, 5};
  auto& engine = fixture.engine();
  auto snapshot = engine.export_snapshot();
  snapshot.clock = std::numeric_limits<clock_tick_t>::max() - 1;
  engine.import_snapshot(snapshot);

  fixture.publish(0, 1, "View", "None");
  ASSERT_TRUE(engine.pending_round(fixture.member(0), 1).has_value());
  EXPECT_TRUE(engine.increment_clock(fixture.owner()).ok());

  const auto result = engine.increment_clock(fixture.owner());
  EXPECT_TRUE(result.is(bulletin_error_code::clock_exhausted));
  EXPECT_EQ(engine.clock(), std::numeric_limits<clock_tick_t>::max());
  EXPECT_TRUE(engine.pending_round(fixture.member(0), 1).has_value());
}

TEST(engine_approval, info_summarizes_state) {
  auto fixture = engine_fixture{3, 4};
  auto& engine = fixture.engine();
  fixture.publish(0, 1, "View", "None");
  fixture.evaluate(1, 1, 0, "OK");
  fixture.evaluate(2, 1, 0, "OK");
  fixture.publish(1, 2, "Other", "None");
  engine.increment_clock(fixture.owner());

  const auto info = engine.info();
  EXPECT_EQ(info.data, "public-bulletin");
  EXPECT_EQ(info.member_count, 3u);
  EXPECT_EQ(info.commitment_count, 1u);
  EXPECT_EQ(info.pending_rounds, 1u);
  EXPECT_EQ(info.clock, 1u);
  EXPECT_EQ(info.timeout, 4u);
  EXPECT_EQ(info.quorum, 2u);
}

TEST(engine_approval, suspended_rounds_survive_snapshot_import) {
  auto original = engine_fixture{3};
  original.publish(0, 1, "View", "None");
  original.evaluate(1, 1, 0, "OK");

  auto restored = engine_fixture{0};
  restored.engine().import_snapshot(original.engine().export_snapshot());
  EXPECT_EQ(restored.engine().export_snapshot(),
            original.engine().export_snapshot());

  const auto result = restored.engine().evaluate_view(
      original.member(2), 1, original.member(0), "OK");
  EXPECT_EQ(result.info, "approved");
  EXPECT_TRUE(restored.engine().commitment(original.member(0), 1).has_value());
}
