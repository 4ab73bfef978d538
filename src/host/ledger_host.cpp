#include <spdlog/spdlog.h>
#include <bulletin/blake3/hash.hpp>
#include <bulletin/common/critical.hpp>
#include <bulletin/host/ledger_host.hpp>
#include <bulletin/schema/encoding/scale/bulletin_snapshot.hpp>
#include <utility>
#include <vector>

using namespace bulletin::schema;

namespace bulletin::host {

ledger_host::ledger_host(execution::engine_options options, std::string db_path)
    : db_path_{std::move(db_path)},
      storage_{bulletin::storage::make_storage<
          bulletin::storage::rocksdb_storage_tag>(db_path_)},
      engine_{std::move(options)} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing ledger host with RocksDB path '{}'", db_path_);
  load_persisted_state();
}

template <typename Operation>
void ledger_host::apply(Operation&& operation) {
  auto result = operation_result_t{};
  auto sinks = std::vector<ledger::event_sink_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    result = operation();
    if (!result.ok()) {
      spdlog::debug("Call in {} ended with code {} ({})", result.codespace,
                    result.code, result.log);
    }
    persist();
    sinks = sinks_;
  }
  // Sinks run with the host unlocked and the call already persisted.
  ledger::event_notifier::dispatch(sinks, result.events);
}

void ledger_host::add_member(const member_id_t& caller,
                             const member_id_t& member) {
  apply([&]() { return engine_.add_member(caller, member); });
}

void ledger_host::remove_member(const member_id_t& caller,
                                const member_id_t& member) {
  apply([&]() { return engine_.remove_member(caller, member); });
}

void ledger_host::publish_view(const member_id_t& caller,
                               const height_t height,
                               const bytes_t& view,
                               const std::string& rolling_hash) {
  apply(
      [&]() { return engine_.publish_view(caller, height, view, rolling_hash); });
}

void ledger_host::evaluate_view(const member_id_t& caller,
                                const height_t height,
                                const member_id_t& evaluated_member,
                                const std::string& verdict) {
  apply([&]() {
    return engine_.evaluate_view(caller, height, evaluated_member, verdict);
  });
}

void ledger_host::report_conflict(const member_id_t& caller,
                                  const height_t height,
                                  const bytes_t& view,
                                  const std::string& rolling_hash) {
  apply([&]() {
    return engine_.report_conflict(caller, height, view, rolling_hash);
  });
}

void ledger_host::set_timeout(const member_id_t& caller,
                              const clock_tick_t timeout) {
  apply([&]() { return engine_.set_timeout(caller, timeout); });
}

void ledger_host::increment_clock(const member_id_t& caller) {
  apply([&]() { return engine_.increment_clock(caller); });
}

void ledger_host::open_replies(const member_id_t& caller,
                               const height_t height,
                               const member_id_t& member) {
  apply([&]() { return engine_.open_replies(caller, height, member); });
}

void ledger_host::subscribe(ledger::event_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  sinks_.push_back(std::move(sink));
}

app_info_t ledger_host::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto info = engine_.info();
  info.state_root = state_root_;
  return info;
}

const execution::engine& ledger_host::state() const {
  return engine_;
}

void ledger_host::load_persisted_state() {
  auto encoded = storage_.load_state();
  if (!encoded) {
    spdlog::info("No persisted bulletin state; starting fresh");
    persist();
    return;
  }

  auto snapshot = encoding::scale::try_decode_snapshot(
      bytes_view_t{encoded->data(), encoded->size()});
  if (!snapshot) {
    bulletin::common::critical("failed to decode persisted bulletin state");
  }
  const auto root =
      bulletin::blake3::hash(bytes_view_t{encoded->data(), encoded->size()});
  const auto committed = storage_.load_committed_state();
  if (!committed || committed->state_root != root) {
    bulletin::common::critical("persisted bulletin state root mismatch");
  }

  const auto records = storage_.list_by_prefix(
      make_bytes_view(bulletin::storage::kStatePrefix));
  for (const auto& record : records) {
    const auto name = make_string(record.first);
    if (name != bulletin::storage::kSnapshotKey &&
        name != bulletin::storage::kCommittedKey) {
      spdlog::error("Unexpected record '{}' under the bulletin state prefix",
                    name);
      bulletin::common::critical("persisted bulletin state is inconsistent");
    }
  }

  engine_.import_snapshot(*snapshot);
  state_root_ = root;
  spdlog::info("Resumed bulletin state at clock {} (state root {})",
               committed->clock, to_hex(state_root_));
}

void ledger_host::persist() {
  const auto snapshot = engine_.export_snapshot();
  const auto encoded = encoding::scale::encode(snapshot);
  state_root_ =
      bulletin::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
  storage_.save_state(encoded, bulletin::storage::committed_state{
                                   .clock = snapshot.clock,
                                   .state_root = state_root_});
}

}  // namespace bulletin::host
