#include <bulletin/schema/bulletin_event.hpp>

#include <algorithm>
#include <iterator>
#include <string>

namespace {

// Views made of visible ASCII print as text; anything else prints as hex so
// every event stays on one line.
std::string render_view(const bulletin::schema::bytes_t& view) {
  const auto printable =
      !view.empty() &&
      std::all_of(std::begin(view), std::end(view),
                  [](const uint8_t byte) { return byte > 0x20 && byte < 0x7f; });
  if (printable) {
    return bulletin::schema::make_string(view);
  }
  return "0x" + bulletin::schema::to_hex(
                    bulletin::schema::make_bytes_view(view));
}

}  // namespace

namespace bulletin::schema {

std::string_view event_name(const bulletin_event_t& event) {
  return std::visit(
      overloaded{[](const view_published_t&) {
                   return std::string_view{"view_published"};
                 },
                 [](const view_conflict_t&) {
                   return std::string_view{"view_conflict"};
                 },
                 [](const view_approval_request_t&) {
                   return std::string_view{"view_approval_request"};
                 }},
      event);
}

std::string describe(const bulletin_event_t& event) {
  auto out = std::string{event_name(event)};
  std::visit(
      overloaded{
          [&](const view_published_t& value) {
            out += " height=" + std::to_string(value.height);
            out += " member=" + to_hex(value.member);
            out += " view=" + render_view(value.view);
          },
          [&](const view_conflict_t& value) {
            out += " height=" + std::to_string(value.height);
            if (value.member) {
              out += " member=" + to_hex(*value.member);
            }
            out += " view=" + render_view(value.view);
            out += " rolling_hash=" + value.rolling_hash;
          },
          [&](const view_approval_request_t& value) {
            out += " height=" + std::to_string(value.height);
            out += " member=" + to_hex(value.member);
            out += " view=" + render_view(value.view);
            out += " rolling_hash=" + value.rolling_hash;
          }},
      event);
  return out;
}

}  // namespace bulletin::schema
