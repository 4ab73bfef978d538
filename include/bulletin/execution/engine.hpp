#pragma once

#include <bulletin/ledger/approval_machine.hpp>
#include <bulletin/ledger/commitment_store.hpp>
#include <bulletin/ledger/event_notifier.hpp>
#include <bulletin/ledger/membership_registry.hpp>
#include <bulletin/ledger/reply_tracker.hpp>
#include <bulletin/schema/app_info.hpp>
#include <bulletin/schema/approval_round.hpp>
#include <bulletin/schema/bulletin_snapshot.hpp>
#include <bulletin/schema/commitment.hpp>
#include <bulletin/schema/operation_result.hpp>
#include <bulletin/schema/primitives.hpp>
#include <bulletin/schema/quorum_policy.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bulletin::execution {

struct engine_options final {
  /// Identity allowed to administer members, the timeout and the clock.
  bulletin::schema::member_id_t owner{};
  bulletin::schema::clock_tick_t timeout{};
  bulletin::schema::quorum_policy_t quorum_policy{
      bulletin::schema::quorum_policy_t::small_committee};
};

/// Public bulletin state machine.
///
/// Owns the whitelist, the commitment store, the reply tracker and the timeout
/// clock. Every operation takes the calling identity explicitly, runs to
/// completion under the engine mutex and reports its outcome as an
/// operation_result; events emitted during the call are returned in the result
/// and handed to subscribed sinks after the state change is complete.
///
/// Commitments and approval rounds are addressed by the calling identity;
/// `evaluate_view` names the proposer whose round it votes on.
class engine final {
 public:
  explicit engine(engine_options options = {});

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Admit a committee member (owner only).
  bulletin::schema::operation_result_t add_member(
      const bulletin::schema::member_id_t& caller,
      const bulletin::schema::member_id_t& member);

  /// Remove a committee member and purge its commitments and replies (owner
  /// only).
  bulletin::schema::operation_result_t remove_member(
      const bulletin::schema::member_id_t& caller,
      const bulletin::schema::member_id_t& member);

  /// Publish `view` at `height` for the caller.
  ///
  /// A view some peer already published at this height is committed right
  /// away when the rolling hash checks out and raises a conflict otherwise. A
  /// novel view goes through an approval round; when the round cannot settle
  /// yet the result is `approval_pending` and later calls finish it.
  bulletin::schema::operation_result_t publish_view(
      const bulletin::schema::member_id_t& caller,
      bulletin::schema::height_t height,
      const bulletin::schema::bytes_t& view,
      const std::string& rolling_hash);

  /// Cast `verdict` on the round of `evaluated_member` at `height`.
  bulletin::schema::operation_result_t evaluate_view(
      const bulletin::schema::member_id_t& caller,
      bulletin::schema::height_t height,
      const bulletin::schema::member_id_t& evaluated_member,
      const std::string& verdict);

  /// Announce a conflict on a view (members only).
  bulletin::schema::operation_result_t report_conflict(
      const bulletin::schema::member_id_t& caller,
      bulletin::schema::height_t height,
      const bulletin::schema::bytes_t& view,
      const std::string& rolling_hash);

  bulletin::schema::operation_result_t set_timeout(
      const bulletin::schema::member_id_t& caller,
      bulletin::schema::clock_tick_t timeout);

  /// Advance the timeout clock by one tick and expire overdue rounds.
  bulletin::schema::operation_result_t increment_clock(
      const bulletin::schema::member_id_t& caller);

  /// Open an empty reply collection for (member, height) so replies can be
  /// gathered before the member publishes (owner only). Replies kept from a
  /// settled round are cleared; a suspended round is left untouched.
  bulletin::schema::operation_result_t open_replies(
      const bulletin::schema::member_id_t& caller,
      bulletin::schema::height_t height,
      const bulletin::schema::member_id_t& member);

  std::optional<bulletin::schema::commitment_t> commitment(
      const bulletin::schema::member_id_t& member,
      bulletin::schema::height_t height) const;

  std::optional<std::vector<std::string>> replies(
      const bulletin::schema::member_id_t& member,
      bulletin::schema::height_t height) const;

  std::optional<bulletin::schema::approval_round_t> pending_round(
      const bulletin::schema::member_id_t& member,
      bulletin::schema::height_t height) const;

  /// Rolling hash a publish by `member` at `height` must carry.
  std::string rolling_hash(const bulletin::schema::member_id_t& member,
                           bulletin::schema::height_t height) const;

  std::vector<bulletin::schema::member_id_t> members() const;
  bool is_member(const bulletin::schema::member_id_t& member) const;
  bulletin::schema::member_id_t owner() const;
  bulletin::schema::clock_tick_t clock() const;
  bulletin::schema::clock_tick_t timeout() const;
  uint32_t quorum() const;

  /// Summary counters; `state_root` is left for the host to fill in.
  bulletin::schema::app_info_t info() const;

  void subscribe(ledger::event_sink_t sink);

  bulletin::schema::bulletin_snapshot_t export_snapshot() const;
  void import_snapshot(const bulletin::schema::bulletin_snapshot_t& snapshot);

 private:
  template <typename Operation>
  bulletin::schema::operation_result_t run(std::string_view codespace,
                                           Operation&& operation);

  bulletin::schema::operation_result_t publish_locked(
      const bulletin::schema::member_id_t& caller,
      bulletin::schema::height_t height,
      const bulletin::schema::bytes_t& view,
      const std::string& rolling_hash);

  /// Commit an approved round, or report the hash gap when the chain no
  /// longer matches.
  bulletin::schema::operation_result_t settle(
      const ledger::round_outcome_t& outcome);

  /// Insert the commitment and emit ViewPublished.
  void commit(const bulletin::schema::member_id_t& member,
              bulletin::schema::height_t height,
              const bulletin::schema::bytes_t& view,
              const std::string& rolling_hash);

  /// Re-sample every suspended round (after clock or membership changes).
  void sweep_rounds();

  ledger::approval_context_t approval_context() const;
  bool is_owner(const bulletin::schema::member_id_t& caller) const;

  mutable std::mutex mutex_;
  engine_options options_;
  bulletin::schema::clock_tick_t clock_{};
  bulletin::schema::clock_tick_t timeout_{};
  ledger::membership_registry membership_;
  ledger::commitment_store commitments_;
  ledger::reply_tracker replies_;
  ledger::event_notifier notifier_;
  ledger::approval_machine approvals_;
};

}  // namespace bulletin::execution
