#pragma once

#include <bulletin/schema/enum_string.hpp>
#include <bulletin/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: approval round.
// Bulletin workflow: the suspended vote on a novel view. It lives next to the
// reply collection of (proposer, height) until quorum or timeout settles it.
namespace bulletin::schema {

template <uint16_t Version>
struct approval_round;

template <>
struct approval_round<1> final {
  uint16_t version{1};
  member_id_t proposer;
  height_t height{};
  bytes_t view;
  std::string rolling_hash;
  clock_tick_t initial_clock{};

  bool operator==(const approval_round&) const = default;
};

using approval_round_t = approval_round<1>;

enum class round_status_t : uint8_t {
  awaiting_replies = 0,
  approved = 1,
  rejected = 2,
  timed_out = 3
};

inline constexpr auto kRoundStatusMappings = enum_mappings_t<round_status_t, 4>{
    std::pair<std::string_view, round_status_t>{
        "awaiting_replies", round_status_t::awaiting_replies},
    std::pair<std::string_view, round_status_t>{"approved",
                                                round_status_t::approved},
    std::pair<std::string_view, round_status_t>{"rejected",
                                                round_status_t::rejected},
    std::pair<std::string_view, round_status_t>{"timed_out",
                                                round_status_t::timed_out}};

inline constexpr std::string_view to_string(const round_status_t value) {
  return to_string(value, kRoundStatusMappings).value_or("unknown");
}

}  // namespace bulletin::schema
