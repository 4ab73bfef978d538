#pragma once

#include <bulletin/schema/bulletin_event.hpp>
#include <bulletin/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace bulletin::testing {

inline bulletin::schema::member_id_t make_member(const uint8_t seed) {
  auto out = bulletin::schema::member_id_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

template <typename Event>
std::size_t count_events(
    const std::vector<bulletin::schema::bulletin_event_t>& events) {
  auto count = std::size_t{0};
  for (const auto& event : events) {
    if (std::holds_alternative<Event>(event)) {
      ++count;
    }
  }
  return count;
}

}  // namespace bulletin::testing
