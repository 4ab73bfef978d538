#pragma once

#include <bulletin/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: quorum policy.
// Bulletin workflow: selects how many replies an approval round needs for a
// committee of N members.
//   majority:        floor(N/2) + 1
//   small_committee: floor(N/2) when N <= 2, else floor(N/2) + 1
namespace bulletin::schema {

enum class quorum_policy_t : uint8_t { majority = 0, small_committee = 1 };

inline constexpr auto kQuorumPolicyMappings =
    enum_mappings_t<quorum_policy_t, 2>{
        std::pair<std::string_view, quorum_policy_t>{
            "majority", quorum_policy_t::majority},
        std::pair<std::string_view, quorum_policy_t>{
            "small_committee", quorum_policy_t::small_committee}};

template <>
inline std::optional<quorum_policy_t> try_from_string<quorum_policy_t>(
    const std::string_view value) {
  return from_string(value, kQuorumPolicyMappings);
}

inline constexpr std::string_view to_string(const quorum_policy_t value) {
  return to_string(value, kQuorumPolicyMappings).value_or("unknown");
}

}  // namespace bulletin::schema
