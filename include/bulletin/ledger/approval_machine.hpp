#pragma once

#include <bulletin/ledger/event_notifier.hpp>
#include <bulletin/ledger/reply_tracker.hpp>
#include <bulletin/schema/approval_round.hpp>
#include <bulletin/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace bulletin::ledger {

/// Clock, timeout and quorum in force when a round is sampled.
struct approval_context_t final {
  bulletin::schema::clock_tick_t now{};
  bulletin::schema::clock_tick_t timeout{};
  uint32_t quorum{};
};

struct round_outcome_t final {
  bulletin::schema::round_status_t status{
      bulletin::schema::round_status_t::awaiting_replies};
  bulletin::schema::approval_round_t round;
};

/// Quorum approval state machine.
///
/// Rounds never block: `begin` suspends the round in the reply tracker and
/// every later `advance` re-samples it. A round settles as
///   approved  - quorum reached, no "NOK"; the reply collection is purged.
///   rejected  - quorum reached with a "NOK"; a conflict is emitted and the
///               replies stay for audit.
///   timed_out - the clock reached initial_clock + timeout first; the
///               collection is purged and nothing is emitted.
class approval_machine final {
 public:
  approval_machine(reply_tracker& replies, event_notifier& notifier);

  /// Suspend a new round (reusing replies already collected for the
  /// coordinate), request approval and sample it once.
  round_outcome_t begin(bulletin::schema::approval_round_t round,
                        const approval_context_t& context);

  /// Re-sample the round suspended at (member, height); std::nullopt when no
  /// round is suspended there.
  std::optional<round_outcome_t> advance(
      const bulletin::schema::member_id_t& member,
      bulletin::schema::height_t height,
      const approval_context_t& context);

 private:
  reply_tracker& replies_;
  event_notifier& notifier_;
};

}  // namespace bulletin::ledger
