#include <spdlog/spdlog.h>
#include <algorithm>
#include <bulletin/execution/engine.hpp>
#include <bulletin/ledger/quorum.hpp>
#include <bulletin/ledger/rolling_hash.hpp>
#include <iterator>
#include <limits>
#include <utility>

using namespace bulletin::schema;

namespace {

constexpr auto kMembershipCodespace = std::string_view{"bulletin.membership"};
constexpr auto kPublishCodespace = std::string_view{"bulletin.publish"};
constexpr auto kEvaluateCodespace = std::string_view{"bulletin.evaluate"};
constexpr auto kConflictCodespace = std::string_view{"bulletin.conflict"};
constexpr auto kClockCodespace = std::string_view{"bulletin.clock"};

operation_result_t make_error(const bulletin_error_code code,
                              std::string log,
                              std::string info = {}) {
  auto result = operation_result_t{};
  result.code = to_code(code);
  result.log = std::move(log);
  result.info = std::move(info);
  return result;
}

operation_result_t make_ok(std::string info = {}) {
  auto result = operation_result_t{};
  result.info = std::move(info);
  return result;
}

}  // namespace

namespace bulletin::execution {

engine::engine(engine_options options)
    : options_{std::move(options)},
      timeout_{options_.timeout},
      approvals_{replies_, notifier_} {
  spdlog::info("Bulletin engine ready (owner {}, timeout {}, quorum policy {})",
               to_hex(options_.owner), timeout_,
               to_string(options_.quorum_policy));
}

template <typename Operation>
operation_result_t engine::run(const std::string_view codespace,
                               Operation&& operation) {
  auto result = operation_result_t{};
  auto sinks = std::vector<ledger::event_sink_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    result = operation();
    result.codespace = std::string{codespace};
    result.events = notifier_.drain();
    if (!result.events.empty()) {
      sinks = notifier_.sinks();
    }
  }
  if (!result.ok()) {
    spdlog::debug("{} rejected with code {}: {}", codespace, result.code,
                  result.log);
  }
  ledger::event_notifier::dispatch(sinks, result.events);
  return result;
}

operation_result_t engine::add_member(const member_id_t& caller,
                                      const member_id_t& member) {
  return run(kMembershipCodespace, [&]() {
    if (!is_owner(caller)) {
      return make_error(bulletin_error_code::unauthorized,
                        "only the owner can add members");
    }
    if (!membership_.add(member)) {
      return make_error(bulletin_error_code::member_exists,
                        "member already whitelisted", to_hex(member));
    }
    commitments_.register_member(member);
    replies_.register_member(member);
    spdlog::info("Member {} added ({} in committee)", to_hex(member),
                 membership_.size());
    sweep_rounds();
    return make_ok();
  });
}

operation_result_t engine::remove_member(const member_id_t& caller,
                                         const member_id_t& member) {
  return run(kMembershipCodespace, [&]() {
    if (!is_owner(caller)) {
      return make_error(bulletin_error_code::unauthorized,
                        "only the owner can remove members");
    }
    if (!membership_.remove(member)) {
      return make_error(bulletin_error_code::member_missing,
                        "member not whitelisted", to_hex(member));
    }
    commitments_.purge_member(member);
    replies_.purge_member(member);
    spdlog::info("Member {} removed ({} in committee)", to_hex(member),
                 membership_.size());
    sweep_rounds();
    return make_ok();
  });
}

operation_result_t engine::publish_view(const member_id_t& caller,
                                        const height_t height,
                                        const bytes_t& view,
                                        const std::string& rolling_hash) {
  return run(kPublishCodespace, [&]() {
    return publish_locked(caller, height, view, rolling_hash);
  });
}

operation_result_t engine::publish_locked(const member_id_t& caller,
                                          const height_t height,
                                          const bytes_t& view,
                                          const std::string& rolling_hash) {
  if (!membership_.contains(caller)) {
    return make_error(bulletin_error_code::unauthorized,
                      "publisher is not whitelisted", to_hex(caller));
  }
  if (commitments_.find(caller, height) != nullptr) {
    return make_error(bulletin_error_code::duplicate_coordinate,
                      "view already published at this height",
                      std::to_string(height));
  }

  const auto peers =
      commitments_.all_commitments_at(height, membership_.members());
  const auto seen = std::any_of(
      std::begin(peers), std::end(peers),
      [&](const commitment_t& peer) { return peer.view == view; });
  if (seen) {
    if (ledger::compute_rolling_hash(commitments_, caller, height) !=
        rolling_hash) {
      notifier_.report_conflict(height, view, rolling_hash, caller);
      return make_error(bulletin_error_code::hash_mismatch,
                        "rolling hash does not extend the publisher's chain",
                        rolling_hash);
    }
    replies_.discard(caller, height);
    commit(caller, height, view, rolling_hash);
    return make_ok("committed");
  }

  const auto context = approval_context();
  auto outcome = std::optional<ledger::round_outcome_t>{};
  if (const auto* collection = replies_.find(caller, height);
      collection != nullptr && collection->round) {
    if (collection->round->view != view ||
        collection->round->rolling_hash != rolling_hash) {
      return make_error(bulletin_error_code::round_in_progress,
                        "another view awaits approval at this height",
                        std::to_string(height));
    }
    outcome = approvals_.advance(caller, height, context);
  } else {
    outcome = approvals_.begin(approval_round_t{.proposer = caller,
                                                .height = height,
                                                .view = view,
                                                .rolling_hash = rolling_hash},
                               context);
  }
  return settle(*outcome);
}

operation_result_t engine::settle(const ledger::round_outcome_t& outcome) {
  const auto& round = outcome.round;
  switch (outcome.status) {
    case round_status_t::approved: {
      if (ledger::compute_rolling_hash(commitments_, round.proposer,
                                       round.height) != round.rolling_hash) {
        spdlog::warn(
            "View approved at height {} but its rolling hash {} is invalid",
            round.height, round.rolling_hash);
        return make_error(bulletin_error_code::approved_hash_invalid,
                          "approved view carries an invalid rolling hash",
                          round.rolling_hash);
      }
      commit(round.proposer, round.height, round.view, round.rolling_hash);
      return make_ok("committed");
    }
    case round_status_t::rejected:
      return make_error(bulletin_error_code::quorum_rejected,
                        "view rejected by the committee",
                        std::to_string(round.height));
    case round_status_t::timed_out:
      return make_error(bulletin_error_code::quorum_timeout,
                        "approval round timed out",
                        std::to_string(round.height));
    case round_status_t::awaiting_replies:
      break;
  }
  return make_error(bulletin_error_code::approval_pending,
                    "view awaits committee approval",
                    std::to_string(round.height));
}

void engine::commit(const member_id_t& member,
                    const height_t height,
                    const bytes_t& view,
                    const std::string& rolling_hash) {
  if (!commitments_.try_insert(
          member, height,
          commitment_t{.view = view, .rolling_hash = rolling_hash})) {
    spdlog::warn("Commitment at height {} for {} was not stored", height,
                 to_hex(member));
    return;
  }
  notifier_.emit(
      view_published_t{.height = height, .member = member, .view = view});
  spdlog::info("View published at height {} by {}", height, to_hex(member));
}

operation_result_t engine::evaluate_view(const member_id_t& caller,
                                         const height_t height,
                                         const member_id_t& evaluated_member,
                                         const std::string& verdict) {
  return run(kEvaluateCodespace, [&]() {
    if (!membership_.contains(caller)) {
      return make_error(bulletin_error_code::unauthorized,
                        "evaluator is not whitelisted", to_hex(caller));
    }
    if (!replies_.append(evaluated_member, height, verdict)) {
      return make_error(bulletin_error_code::no_open_round,
                        "no replies are being collected at this coordinate",
                        std::to_string(height));
    }
    const auto outcome =
        approvals_.advance(evaluated_member, height, approval_context());
    if (!outcome) {
      return make_ok();
    }
    if (outcome->status == round_status_t::awaiting_replies) {
      return make_ok(std::string{to_string(outcome->status)});
    }
    // The vote settled the proposer's round; its outcome is informational.
    const auto settled = settle(*outcome);
    if (!settled.ok()) {
      spdlog::debug("Round at height {} settled with code {}", height,
                    settled.code);
    }
    return make_ok(std::string{to_string(outcome->status)});
  });
}

operation_result_t engine::report_conflict(const member_id_t& caller,
                                           const height_t height,
                                           const bytes_t& view,
                                           const std::string& rolling_hash) {
  return run(kConflictCodespace, [&]() {
    if (!membership_.contains(caller)) {
      return make_error(bulletin_error_code::unauthorized,
                        "reporter is not whitelisted", to_hex(caller));
    }
    notifier_.report_conflict(height, view, rolling_hash, caller);
    spdlog::info("Conflict reported at height {} by {}", height,
                 to_hex(caller));
    return make_ok();
  });
}

operation_result_t engine::set_timeout(const member_id_t& caller,
                                       const clock_tick_t timeout) {
  return run(kClockCodespace, [&]() {
    if (!is_owner(caller)) {
      return make_error(bulletin_error_code::unauthorized,
                        "only the owner can set the timeout");
    }
    timeout_ = timeout;
    spdlog::info("Approval timeout set to {}", timeout_);
    return make_ok();
  });
}

operation_result_t engine::increment_clock(const member_id_t& caller) {
  return run(kClockCodespace, [&]() {
    if (!is_owner(caller)) {
      return make_error(bulletin_error_code::unauthorized,
                        "only the owner can advance the clock");
    }
    if (clock_ == std::numeric_limits<clock_tick_t>::max()) {
      return make_error(bulletin_error_code::clock_exhausted,
                        "clock is at its maximum", std::to_string(clock_));
    }
    ++clock_;
    spdlog::debug("Clock advanced to {}", clock_);
    sweep_rounds();
    return make_ok(std::to_string(clock_));
  });
}

operation_result_t engine::open_replies(const member_id_t& caller,
                                        const height_t height,
                                        const member_id_t& member) {
  return run(kEvaluateCodespace, [&]() {
    if (!is_owner(caller)) {
      return make_error(bulletin_error_code::unauthorized,
                        "only the owner can open reply collections");
    }
    if (const auto* existing = replies_.find(member, height);
        existing != nullptr && existing->round) {
      return make_error(bulletin_error_code::round_in_progress,
                        "a view awaits approval at this coordinate",
                        std::to_string(height));
    }
    auto* collection = replies_.open(member, height);
    if (collection == nullptr) {
      return make_error(bulletin_error_code::member_missing,
                        "member not whitelisted", to_hex(member));
    }
    if (!collection->replies.empty()) {
      spdlog::info("Cleared {} kept repl(ies) at height {} for {}",
                   collection->replies.size(), height, to_hex(member));
      collection->replies.clear();
    }
    return make_ok();
  });
}

void engine::sweep_rounds() {
  const auto context = approval_context();
  for (const auto& [member, height] :
       replies_.pending_rounds(membership_.members())) {
    const auto outcome = approvals_.advance(member, height, context);
    if (!outcome || outcome->status == round_status_t::awaiting_replies) {
      continue;
    }
    const auto settled = settle(*outcome);
    spdlog::debug("Suspended round at height {} settled as {} (code {})",
                  height, to_string(outcome->status), settled.code);
  }
}

ledger::approval_context_t engine::approval_context() const {
  return ledger::approval_context_t{
      .now = clock_,
      .timeout = timeout_,
      .quorum =
          ledger::quorum_threshold(membership_.size(), options_.quorum_policy)};
}

bool engine::is_owner(const member_id_t& caller) const {
  return caller == options_.owner;
}

std::optional<commitment_t> engine::commitment(const member_id_t& member,
                                               const height_t height) const {
  auto lock = std::scoped_lock{mutex_};
  return commitments_.get(member, height);
}

std::optional<std::vector<std::string>> engine::replies(
    const member_id_t& member,
    const height_t height) const {
  auto lock = std::scoped_lock{mutex_};
  const auto* collection = replies_.find(member, height);
  if (collection == nullptr) {
    return std::nullopt;
  }
  return collection->replies;
}

std::optional<approval_round_t> engine::pending_round(
    const member_id_t& member,
    const height_t height) const {
  auto lock = std::scoped_lock{mutex_};
  const auto* collection = replies_.find(member, height);
  if (collection == nullptr) {
    return std::nullopt;
  }
  return collection->round;
}

std::string engine::rolling_hash(const member_id_t& member,
                                 const height_t height) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger::compute_rolling_hash(commitments_, member, height);
}

std::vector<member_id_t> engine::members() const {
  auto lock = std::scoped_lock{mutex_};
  return membership_.members();
}

bool engine::is_member(const member_id_t& member) const {
  auto lock = std::scoped_lock{mutex_};
  return membership_.contains(member);
}

member_id_t engine::owner() const {
  return options_.owner;
}

clock_tick_t engine::clock() const {
  auto lock = std::scoped_lock{mutex_};
  return clock_;
}

clock_tick_t engine::timeout() const {
  auto lock = std::scoped_lock{mutex_};
  return timeout_;
}

uint32_t engine::quorum() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger::quorum_threshold(membership_.size(), options_.quorum_policy);
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto info = app_info_t{};
  info.member_count = membership_.size();
  info.commitment_count = commitments_.size();
  info.pending_rounds = replies_.pending_rounds(membership_.members()).size();
  info.clock = clock_;
  info.timeout = timeout_;
  info.quorum =
      ledger::quorum_threshold(membership_.size(), options_.quorum_policy);
  info.quorum_policy = options_.quorum_policy;
  info.state_root = make_zero_hash();
  return info;
}

void engine::subscribe(ledger::event_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  notifier_.subscribe(std::move(sink));
}

bulletin_snapshot_t engine::export_snapshot() const {
  auto lock = std::scoped_lock{mutex_};
  auto snapshot = bulletin_snapshot_t{};
  snapshot.clock = clock_;
  snapshot.timeout = timeout_;
  snapshot.whitelist = membership_.members();
  snapshot.commitments = commitments_.export_records(membership_.members());
  snapshot.replies = replies_.export_records(membership_.members());
  return snapshot;
}

void engine::import_snapshot(const bulletin_snapshot_t& snapshot) {
  auto lock = std::scoped_lock{mutex_};
  clock_ = snapshot.clock;
  timeout_ = snapshot.timeout;
  membership_.assign(snapshot.whitelist);
  commitments_.import_records(snapshot.whitelist, snapshot.commitments);
  replies_.import_records(snapshot.whitelist, snapshot.replies);
  spdlog::info(
      "Imported bulletin state: {} member(s), {} commitment(s), clock {}",
      membership_.size(), commitments_.size(), clock_);
}

}  // namespace bulletin::execution
