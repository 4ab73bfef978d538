#include <blake3.h>
#include <bulletin/blake3/hash.hpp>

namespace bulletin::blake3 {

bulletin::schema::hash32_t hash(const std::string_view& str) {
  return hash(bulletin::schema::make_bytes_view(str));
}

bulletin::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = bulletin::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<bulletin::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace bulletin::blake3
