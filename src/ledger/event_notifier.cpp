#include <bulletin/ledger/event_notifier.hpp>

#include <utility>

using namespace bulletin::schema;

namespace bulletin::ledger {

void event_notifier::subscribe(event_sink_t sink) {
  sinks_.push_back(std::move(sink));
}

void event_notifier::emit(bulletin_event_t event) {
  pending_.push_back(std::move(event));
}

void event_notifier::report_conflict(const height_t height,
                                     const bytes_t& view,
                                     const std::string& rolling_hash,
                                     std::optional<member_id_t> member) {
  emit(view_conflict_t{.height = height,
                       .member = std::move(member),
                       .view = view,
                       .rolling_hash = rolling_hash});
}

std::vector<bulletin_event_t> event_notifier::drain() {
  auto events = std::vector<bulletin_event_t>{};
  events.swap(pending_);
  return events;
}

std::vector<event_sink_t> event_notifier::sinks() const {
  return sinks_;
}

void event_notifier::dispatch(const std::vector<event_sink_t>& sinks,
                              const std::vector<bulletin_event_t>& events) {
  for (const auto& event : events) {
    for (const auto& sink : sinks) {
      sink(event);
    }
  }
}

}  // namespace bulletin::ledger
