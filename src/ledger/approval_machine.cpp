#include <bulletin/ledger/approval_machine.hpp>
#include <bulletin/schema/verdict.hpp>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <utility>

using namespace bulletin::schema;

namespace bulletin::ledger {

approval_machine::approval_machine(reply_tracker& replies,
                                   event_notifier& notifier)
    : replies_{replies}, notifier_{notifier} {}

round_outcome_t approval_machine::begin(approval_round_t round,
                                        const approval_context_t& context) {
  auto* collection = replies_.open(round.proposer, round.height);
  if (collection == nullptr) {
    // Unregistered proposers never reach the approval path.
    return round_outcome_t{.status = round_status_t::timed_out,
                           .round = std::move(round)};
  }

  round.initial_clock = context.now;
  collection->round = round;
  notifier_.emit(view_approval_request_t{.height = round.height,
                                         .member = round.proposer,
                                         .view = round.view,
                                         .rolling_hash = round.rolling_hash});
  spdlog::debug("Approval round opened at height {} (clock {}, quorum {})",
                round.height, context.now, context.quorum);

  auto outcome = advance(round.proposer, round.height, context);
  return outcome.value_or(round_outcome_t{.status = round_status_t::timed_out,
                                          .round = std::move(round)});
}

std::optional<round_outcome_t> approval_machine::advance(
    const member_id_t& member,
    const height_t height,
    const approval_context_t& context) {
  auto* collection = replies_.find(member, height);
  if (collection == nullptr || !collection->round) {
    return std::nullopt;
  }

  auto outcome = round_outcome_t{.status = round_status_t::awaiting_replies,
                                 .round = *collection->round};
  if (collection->replies.size() >= context.quorum) {
    const auto rejected = std::any_of(
        std::begin(collection->replies), std::end(collection->replies),
        [](const std::string& reply) {
          return classify_reply(reply) == verdict_t::reject;
        });
    if (rejected) {
      outcome.status = round_status_t::rejected;
      collection->round.reset();
      notifier_.report_conflict(height, outcome.round.view,
                                outcome.round.rolling_hash, member);
      spdlog::info("Approval round at height {} rejected by quorum", height);
    } else {
      outcome.status = round_status_t::approved;
      replies_.discard(member, height);
      spdlog::debug("Approval round at height {} approved", height);
    }
    return outcome;
  }

  const auto deadline = static_cast<uint64_t>(outcome.round.initial_clock) +
                        static_cast<uint64_t>(context.timeout);
  if (static_cast<uint64_t>(context.now) >= deadline) {
    outcome.status = round_status_t::timed_out;
    replies_.discard(member, height);
    spdlog::info("Approval round at height {} timed out at clock {}", height,
                 context.now);
  }
  return outcome;
}

}  // namespace bulletin::ledger
