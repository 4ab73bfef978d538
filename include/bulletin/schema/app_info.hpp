#pragma once

#include <bulletin/schema/primitives.hpp>
#include <bulletin/schema/quorum_policy.hpp>
#include <cstdint>
#include <string>

namespace bulletin::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"public-bulletin"};
  std::string version{"0.1.0"};
  uint64_t member_count{};
  uint64_t commitment_count{};
  uint64_t pending_rounds{};
  clock_tick_t clock{};
  clock_tick_t timeout{};
  uint32_t quorum{};
  quorum_policy_t quorum_policy{quorum_policy_t::small_committee};
  hash32_t state_root;
};

using app_info_t = app_info<1>;

}  // namespace bulletin::schema
