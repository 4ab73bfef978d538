#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bulletin::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

/// Committee member identity (fixed-size account id).
using member_id_t = hash32_t;
/// Height of the external chain a view describes.
using height_t = int32_t;
/// Tick count of the host timeout clock.
using clock_tick_t = uint32_t;

/// Rolling hash value of the first commitment in a member's chain.
inline constexpr auto kGenesisRollingHash = std::string_view{"None"};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

}  // namespace bulletin::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
