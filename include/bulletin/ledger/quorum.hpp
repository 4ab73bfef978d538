#pragma once

#include <bulletin/schema/quorum_policy.hpp>
#include <cstddef>
#include <cstdint>

namespace bulletin::ledger {

/// Number of replies an approval round needs for a committee of
/// `committee_size` members.
constexpr uint32_t quorum_threshold(
    const std::size_t committee_size,
    const bulletin::schema::quorum_policy_t policy) {
  const auto half = static_cast<uint32_t>(committee_size / 2);
  if (policy == bulletin::schema::quorum_policy_t::small_committee &&
      committee_size <= 2) {
    return half;
  }
  return half + 1;
}

}  // namespace bulletin::ledger
