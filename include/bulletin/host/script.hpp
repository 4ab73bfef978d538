#pragma once

#include <bulletin/host/ledger_host.hpp>
#include <bulletin/schema/primitives.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

// Line oriented driver for a ledger host. Each line is
//   <caller> <operation> [args...]
// where identities are `owner`, a 64 digit hex member id or a plain name.
namespace bulletin::host {

struct add_member_command final {
  bulletin::schema::member_id_t member;
};

struct remove_member_command final {
  bulletin::schema::member_id_t member;
};

struct publish_command final {
  bulletin::schema::height_t height{};
  bulletin::schema::bytes_t view;
  std::string rolling_hash;
};

struct evaluate_command final {
  bulletin::schema::height_t height{};
  bulletin::schema::member_id_t member;
  std::string verdict;
};

struct report_conflict_command final {
  bulletin::schema::height_t height{};
  bulletin::schema::bytes_t view;
  std::string rolling_hash;
};

struct set_timeout_command final {
  bulletin::schema::clock_tick_t timeout{};
};

struct tick_command final {};

struct open_replies_command final {
  bulletin::schema::height_t height{};
  bulletin::schema::member_id_t member;
};

struct info_command final {};

using operation_t = std::variant<add_member_command,
                                 remove_member_command,
                                 publish_command,
                                 evaluate_command,
                                 report_conflict_command,
                                 set_timeout_command,
                                 tick_command,
                                 open_replies_command,
                                 info_command>;

struct script_command_t final {
  bulletin::schema::member_id_t caller;
  operation_t operation;
};

/// `owner` maps to the configured owner, 64 hex digits decode to an id and
/// any other token names a member whose id is BLAKE3(name).
bulletin::schema::member_id_t resolve_identity(
    std::string_view token,
    const bulletin::schema::member_id_t& owner);

/// Parse one script line. Blank and `#` lines yield std::nullopt with an empty
/// error; malformed lines yield std::nullopt and a message in `error`.
std::optional<script_command_t> parse_script_line(
    std::string_view line,
    const bulletin::schema::member_id_t& owner,
    std::string& error);

/// Run a command against the host; `info` writes a summary line to `out`.
void execute(ledger_host& host,
             const script_command_t& command,
             std::ostream& out);

}  // namespace bulletin::host
