#pragma once
#include <bulletin/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace bulletin::hash {

/// Incremental SipHash-1-3 (one compression round, three finalization
/// rounds). Default keys are zero, which yields the values the reference
/// bulletin chain was built with.
class siphash13 final {
 public:
  explicit siphash13(uint64_t k0 = 0, uint64_t k1 = 0);

  siphash13& update(const std::span<const uint8_t>& bytes);
  siphash13& update(const std::string_view& str);

  /// Digest of everything written so far. Does not reset the state.
  uint64_t finish() const;

 private:
  void compress(uint64_t word);

  uint64_t v0_;
  uint64_t v1_;
  uint64_t v2_;
  uint64_t v3_;
  uint64_t tail_{};
  std::size_t tail_length_{};
  std::size_t length_{};
};

/// Lowercase hexadecimal without zero padding (e.g. 0xab -> "ab").
std::string to_hex_string(uint64_t value);

}  // namespace bulletin::hash
