#pragma once
#include <bulletin/schema/primitives.hpp>
#include <optional>
#include <span>

namespace bulletin::schema::encoding {

// Encoder selection is a build time setting: callers name the library tag
// (e.g. encoder<scale_encoder_tag>) and the specialization does the work.
template <typename Library>
struct encoder {
  template <typename T>
  bulletin::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bulletin::schema::bytes_t& out);

  template <typename T>
  T decode(const bulletin::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bulletin::schema::bytes_view_t& bytes);
};

}  // namespace bulletin::schema::encoding
