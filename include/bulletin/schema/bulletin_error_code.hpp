#pragma once

#include <cstdint>

namespace bulletin::schema {

/// Outcome codes carried by operation results. Zero is success.
///
/// `approval_pending` is not a failure: the view entered an approval round
/// that later calls will settle.
enum class bulletin_error_code : uint32_t {
  unauthorized = 1,
  duplicate_coordinate = 2,
  hash_mismatch = 3,
  quorum_rejected = 4,
  quorum_timeout = 5,
  approved_hash_invalid = 6,
  approval_pending = 7,
  round_in_progress = 8,
  no_open_round = 9,
  member_exists = 10,
  member_missing = 11,
  clock_exhausted = 12,
};

constexpr uint32_t to_code(const bulletin_error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace bulletin::schema
