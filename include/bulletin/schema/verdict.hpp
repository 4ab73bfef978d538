#pragma once

#include <bulletin/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: verdict.
// Bulletin workflow: the reply a committee member casts on another member's
// proposed view. Replies are stored verbatim; only "NOK" rejects.
namespace bulletin::schema {

enum class verdict_t : uint8_t { approve = 0, reject = 1 };

inline constexpr auto kVerdictMappings = enum_mappings_t<verdict_t, 2>{
    std::pair<std::string_view, verdict_t>{"OK", verdict_t::approve},
    std::pair<std::string_view, verdict_t>{"NOK", verdict_t::reject}};

template <>
inline std::optional<verdict_t> try_from_string<verdict_t>(
    const std::string_view value) {
  return from_string(value, kVerdictMappings);
}

inline constexpr std::string_view to_string(const verdict_t value) {
  return to_string(value, kVerdictMappings).value_or("OK");
}

/// Free-form replies other than "NOK" count as approvals.
inline constexpr verdict_t classify_reply(const std::string_view reply) {
  return reply == to_string(verdict_t::reject) ? verdict_t::reject
                                               : verdict_t::approve;
}

}  // namespace bulletin::schema
