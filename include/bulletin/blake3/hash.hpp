#pragma once
#include <bulletin/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace bulletin::blake3 {

bulletin::schema::hash32_t hash(const std::string_view& str);
bulletin::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace bulletin::blake3
