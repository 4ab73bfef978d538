#pragma once

#include <bulletin/schema/bulletin_error_code.hpp>
#include <bulletin/schema/bulletin_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: operation result.
// Bulletin workflow: internal outcome of one externally invoked call. Hosts
// keep the external surface silent; tests assert on the code.
namespace bulletin::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<bulletin_event_t> events;

  bool ok() const { return code == 0; }
  bool is(const bulletin_error_code error) const {
    return code == to_code(error);
  }
};

using operation_result_t = operation_result<1>;

}  // namespace bulletin::schema
