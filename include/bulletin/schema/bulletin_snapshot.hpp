#pragma once

#include <bulletin/schema/approval_round.hpp>
#include <bulletin/schema/commitment.hpp>
#include <bulletin/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: bulletin snapshot.
// Bulletin workflow: the complete owned state of a bulletin, flattened for
// export to a host's durable storage and re-import on start-up.
namespace bulletin::schema {

struct commitment_record_t final {
  member_id_t member;
  height_t height{};
  commitment_t commitment;

  bool operator==(const commitment_record_t&) const = default;
};

struct reply_record_t final {
  member_id_t member;
  height_t height{};
  std::vector<std::string> replies;
  std::optional<approval_round_t> round;

  bool operator==(const reply_record_t&) const = default;
};

template <uint16_t Version>
struct bulletin_snapshot;

template <>
struct bulletin_snapshot<1> final {
  uint16_t version{1};
  clock_tick_t clock{};
  clock_tick_t timeout{};
  std::vector<member_id_t> whitelist;
  std::vector<commitment_record_t> commitments;
  std::vector<reply_record_t> replies;

  bool operator==(const bulletin_snapshot&) const = default;
};

using bulletin_snapshot_t = bulletin_snapshot<1>;

}  // namespace bulletin::schema
