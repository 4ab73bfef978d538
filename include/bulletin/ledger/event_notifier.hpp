#pragma once

#include <bulletin/schema/bulletin_event.hpp>
#include <bulletin/schema/primitives.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bulletin::ledger {

using event_sink_t =
    std::function<void(const bulletin::schema::bulletin_event_t& event)>;

/// Buffers the events of the running operation and hands them to the
/// subscribed sinks once the operation has completed.
class event_notifier final {
 public:
  void subscribe(event_sink_t sink);

  void emit(bulletin::schema::bulletin_event_t event);

  /// Conflict on (height, view, rolling_hash), optionally attributed.
  void report_conflict(bulletin::schema::height_t height,
                       const bulletin::schema::bytes_t& view,
                       const std::string& rolling_hash,
                       std::optional<bulletin::schema::member_id_t> member);

  /// Take the events buffered since the last drain.
  std::vector<bulletin::schema::bulletin_event_t> drain();

  /// Copy of the subscribed sinks, taken under the owner's lock so that
  /// dispatch does not race with subscribe.
  std::vector<event_sink_t> sinks() const;

  static void dispatch(
      const std::vector<event_sink_t>& sinks,
      const std::vector<bulletin::schema::bulletin_event_t>& events);

 private:
  std::vector<bulletin::schema::bulletin_event_t> pending_;
  std::vector<event_sink_t> sinks_;
};

}  // namespace bulletin::ledger
