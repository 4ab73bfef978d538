#pragma once

#include <bulletin/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: commitment.
// Bulletin workflow: the (view, rolling hash) pair a member published for one
// height. Written once, never replaced.
namespace bulletin::schema {

template <uint16_t Version>
struct commitment;

template <>
struct commitment<1> final {
  uint16_t version{1};
  bytes_t view;
  std::string rolling_hash;

  bool operator==(const commitment&) const = default;
};

using commitment_t = commitment<1>;

}  // namespace bulletin::schema
