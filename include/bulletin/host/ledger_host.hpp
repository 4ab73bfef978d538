#pragma once

#include <bulletin/execution/engine.hpp>
#include <bulletin/ledger/event_notifier.hpp>
#include <bulletin/schema/app_info.hpp>
#include <bulletin/schema/primitives.hpp>
#include <bulletin/storage/rocksdb/storage.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace bulletin::host {

/// Durable host of one bulletin engine.
///
/// The call surface is silent: operations return nothing and observers learn
/// outcomes only through events and state. After every call the engine state
/// is SCALE encoded and written to RocksDB with its BLAKE3 state root in one
/// atomic batch; a host opened on an existing database resumes from it.
class ledger_host final {
 public:
  ledger_host(execution::engine_options options, std::string db_path);

  ledger_host(const ledger_host&) = delete;
  ledger_host& operator=(const ledger_host&) = delete;

  void add_member(const bulletin::schema::member_id_t& caller,
                  const bulletin::schema::member_id_t& member);
  void remove_member(const bulletin::schema::member_id_t& caller,
                     const bulletin::schema::member_id_t& member);
  void publish_view(const bulletin::schema::member_id_t& caller,
                    bulletin::schema::height_t height,
                    const bulletin::schema::bytes_t& view,
                    const std::string& rolling_hash);
  void evaluate_view(const bulletin::schema::member_id_t& caller,
                     bulletin::schema::height_t height,
                     const bulletin::schema::member_id_t& evaluated_member,
                     const std::string& verdict);
  void report_conflict(const bulletin::schema::member_id_t& caller,
                       bulletin::schema::height_t height,
                       const bulletin::schema::bytes_t& view,
                       const std::string& rolling_hash);
  void set_timeout(const bulletin::schema::member_id_t& caller,
                   bulletin::schema::clock_tick_t timeout);
  void increment_clock(const bulletin::schema::member_id_t& caller);
  void open_replies(const bulletin::schema::member_id_t& caller,
                    bulletin::schema::height_t height,
                    const bulletin::schema::member_id_t& member);

  /// Sinks are called after the call is persisted and the host lock is
  /// released, so a sink may call back into the host.
  void subscribe(ledger::event_sink_t sink);

  /// Engine summary with the state root of the last persisted state.
  bulletin::schema::app_info_t info() const;

  /// Read access for state queries.
  const execution::engine& state() const;

 private:
  template <typename Operation>
  void apply(Operation&& operation);

  void load_persisted_state();
  void persist();

  mutable std::mutex mutex_;
  std::string db_path_;
  storage::storage<storage::rocksdb_storage_tag> storage_;
  execution::engine engine_;
  bulletin::schema::hash32_t state_root_{};
  std::vector<ledger::event_sink_t> sinks_;
};

}  // namespace bulletin::host
