#include <bulletin/hash/siphash.hpp>

#include <array>
#include <charconv>

namespace bulletin::hash {

namespace {

constexpr uint64_t rotl(const uint64_t x, const int b) {
  return (x << b) | (x >> (64 - b));
}

void sip_round(uint64_t& v0, uint64_t& v1, uint64_t& v2, uint64_t& v3) {
  v0 += v1;
  v1 = rotl(v1, 13);
  v1 ^= v0;
  v0 = rotl(v0, 32);
  v2 += v3;
  v3 = rotl(v3, 16);
  v3 ^= v2;
  v0 += v3;
  v3 = rotl(v3, 21);
  v3 ^= v0;
  v2 += v1;
  v1 = rotl(v1, 17);
  v1 ^= v2;
  v2 = rotl(v2, 32);
}

}  // namespace

siphash13::siphash13(const uint64_t k0, const uint64_t k1)
    : v0_{k0 ^ 0x736f6d6570736575ULL},
      v1_{k1 ^ 0x646f72616e646f6dULL},
      v2_{k0 ^ 0x6c7967656e657261ULL},
      v3_{k1 ^ 0x7465646279746573ULL} {}

void siphash13::compress(const uint64_t word) {
  v3_ ^= word;
  sip_round(v0_, v1_, v2_, v3_);
  v0_ ^= word;
}

siphash13& siphash13::update(const std::span<const uint8_t>& bytes) {
  for (const auto byte : bytes) {
    tail_ |= static_cast<uint64_t>(byte) << (8 * tail_length_);
    ++tail_length_;
    if (tail_length_ == 8) {
      compress(tail_);
      tail_ = 0;
      tail_length_ = 0;
    }
  }
  length_ += bytes.size();
  return *this;
}

siphash13& siphash13::update(const std::string_view& str) {
  return update(bulletin::schema::make_bytes_view(str));
}

uint64_t siphash13::finish() const {
  auto v0 = v0_;
  auto v1 = v1_;
  auto v2 = v2_;
  auto v3 = v3_;

  const auto last = (static_cast<uint64_t>(length_ & 0xFFu) << 56u) | tail_;
  v3 ^= last;
  sip_round(v0, v1, v2, v3);
  v0 ^= last;

  v2 ^= 0xFFu;
  sip_round(v0, v1, v2, v3);
  sip_round(v0, v1, v2, v3);
  sip_round(v0, v1, v2, v3);
  return v0 ^ v1 ^ v2 ^ v3;
}

std::string to_hex_string(const uint64_t value) {
  auto buffer = std::array<char, 16>{};
  auto [end, error] =
      std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, 16);
  static_cast<void>(error);
  return std::string{buffer.data(), end};
}

}  // namespace bulletin::hash
