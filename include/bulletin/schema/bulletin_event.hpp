#pragma once

#include <bulletin/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// Schema type: bulletin events.
// Bulletin workflow: fire-and-forget notifications, the only way observers
// learn about publications, approval requests and conflicts.
namespace bulletin::schema {

template <uint16_t Version>
struct view_published;

template <>
struct view_published<1> final {
  uint16_t version{1};
  height_t height{};
  member_id_t member;
  bytes_t view;

  bool operator==(const view_published&) const = default;
};

template <uint16_t Version>
struct view_conflict;

template <>
struct view_conflict<1> final {
  uint16_t version{1};
  height_t height{};
  std::optional<member_id_t> member;
  bytes_t view;
  std::string rolling_hash;

  bool operator==(const view_conflict&) const = default;
};

template <uint16_t Version>
struct view_approval_request;

template <>
struct view_approval_request<1> final {
  uint16_t version{1};
  height_t height{};
  member_id_t member;
  bytes_t view;
  std::string rolling_hash;

  bool operator==(const view_approval_request&) const = default;
};

using view_published_t = view_published<1>;
using view_conflict_t = view_conflict<1>;
using view_approval_request_t = view_approval_request<1>;

using bulletin_event_t =
    std::variant<view_published_t, view_conflict_t, view_approval_request_t>;

/// Event name as printed by hosts ("view_published", ...).
std::string_view event_name(const bulletin_event_t& event);

/// Single-line human readable rendering used by logs and the CLI.
std::string describe(const bulletin_event_t& event);

}  // namespace bulletin::schema
