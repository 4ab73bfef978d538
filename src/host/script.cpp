#include <bulletin/blake3/hash.hpp>
#include <bulletin/host/script.hpp>
#include <bulletin/schema/quorum_policy.hpp>

#include <charconv>
#include <cctype>
#include <cstdint>
#include <system_error>
#include <vector>

using namespace bulletin::schema;

namespace {

std::vector<std::string_view> tokenize(std::string_view line) {
  auto tokens = std::vector<std::string_view>{};
  while (!line.empty()) {
    auto start = size_t{0};
    while (start < line.size() &&
           std::isspace(static_cast<unsigned char>(line[start])) != 0) {
      ++start;
    }
    line.remove_prefix(start);
    if (line.empty()) {
      break;
    }
    auto end = size_t{0};
    while (end < line.size() &&
           std::isspace(static_cast<unsigned char>(line[end])) == 0) {
      ++end;
    }
    tokens.push_back(line.substr(0, end));
    line.remove_prefix(end);
  }
  return tokens;
}

template <typename T>
std::optional<T> parse_number(const std::string_view token) {
  auto value = T{};
  const auto* last = token.data() + token.size();
  auto [ptr, ec] = std::from_chars(token.data(), last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

bool expect_arguments(const std::vector<std::string_view>& tokens,
                      const size_t count,
                      std::string& error) {
  if (tokens.size() != count + 2) {
    error = std::string{tokens[1]} + " expects " + std::to_string(count) +
            " argument(s)";
    return false;
  }
  return true;
}

}  // namespace

namespace bulletin::host {

member_id_t resolve_identity(const std::string_view token,
                             const member_id_t& owner) {
  if (token == "owner") {
    return owner;
  }
  if (token.size() == 64) {
    if (auto decoded = try_make_hash32(token)) {
      return *decoded;
    }
  }
  return bulletin::blake3::hash(token);
}

std::optional<script_command_t> parse_script_line(const std::string_view line,
                                                  const member_id_t& owner,
                                                  std::string& error) {
  error.clear();
  const auto tokens = tokenize(line);
  if (tokens.empty() || tokens.front().starts_with('#')) {
    return std::nullopt;
  }
  if (tokens.size() < 2) {
    error = "expected '<caller> <operation> [args...]'";
    return std::nullopt;
  }

  auto command = script_command_t{};
  command.caller = resolve_identity(tokens[0], owner);
  const auto operation = tokens[1];

  if (operation == "add_member" || operation == "remove_member") {
    if (!expect_arguments(tokens, 1, error)) {
      return std::nullopt;
    }
    const auto member = resolve_identity(tokens[2], owner);
    if (operation == "add_member") {
      command.operation = add_member_command{.member = member};
    } else {
      command.operation = remove_member_command{.member = member};
    }
    return command;
  }

  if (operation == "publish" || operation == "report_conflict") {
    if (!expect_arguments(tokens, 3, error)) {
      return std::nullopt;
    }
    const auto height = parse_number<height_t>(tokens[2]);
    if (!height) {
      error = "invalid height '" + std::string{tokens[2]} + "'";
      return std::nullopt;
    }
    auto view = make_bytes(tokens[3]);
    auto rolling_hash = std::string{tokens[4]};
    if (operation == "publish") {
      command.operation = publish_command{.height = *height,
                                          .view = std::move(view),
                                          .rolling_hash = rolling_hash};
    } else {
      command.operation =
          report_conflict_command{.height = *height,
                                  .view = std::move(view),
                                  .rolling_hash = rolling_hash};
    }
    return command;
  }

  if (operation == "evaluate") {
    if (!expect_arguments(tokens, 3, error)) {
      return std::nullopt;
    }
    const auto height = parse_number<height_t>(tokens[2]);
    if (!height) {
      error = "invalid height '" + std::string{tokens[2]} + "'";
      return std::nullopt;
    }
    command.operation =
        evaluate_command{.height = *height,
                         .member = resolve_identity(tokens[3], owner),
                         .verdict = std::string{tokens[4]}};
    return command;
  }

  if (operation == "open_replies") {
    if (!expect_arguments(tokens, 2, error)) {
      return std::nullopt;
    }
    const auto height = parse_number<height_t>(tokens[2]);
    if (!height) {
      error = "invalid height '" + std::string{tokens[2]} + "'";
      return std::nullopt;
    }
    command.operation = open_replies_command{
        .height = *height, .member = resolve_identity(tokens[3], owner)};
    return command;
  }

  if (operation == "set_timeout") {
    if (!expect_arguments(tokens, 1, error)) {
      return std::nullopt;
    }
    const auto timeout = parse_number<clock_tick_t>(tokens[2]);
    if (!timeout) {
      error = "invalid timeout '" + std::string{tokens[2]} + "'";
      return std::nullopt;
    }
    command.operation = set_timeout_command{.timeout = *timeout};
    return command;
  }

  if (operation == "tick" || operation == "info") {
    if (!expect_arguments(tokens, 0, error)) {
      return std::nullopt;
    }
    if (operation == "tick") {
      command.operation = tick_command{};
    } else {
      command.operation = info_command{};
    }
    return command;
  }

  error = "unknown operation '" + std::string{operation} + "'";
  return std::nullopt;
}

void execute(ledger_host& host,
             const script_command_t& command,
             std::ostream& out) {
  const auto& caller = command.caller;
  std::visit(
      overloaded{
          [&](const add_member_command& op) {
            host.add_member(caller, op.member);
          },
          [&](const remove_member_command& op) {
            host.remove_member(caller, op.member);
          },
          [&](const publish_command& op) {
            host.publish_view(caller, op.height, op.view, op.rolling_hash);
          },
          [&](const evaluate_command& op) {
            host.evaluate_view(caller, op.height, op.member, op.verdict);
          },
          [&](const report_conflict_command& op) {
            host.report_conflict(caller, op.height, op.view, op.rolling_hash);
          },
          [&](const set_timeout_command& op) {
            host.set_timeout(caller, op.timeout);
          },
          [&](const tick_command&) { host.increment_clock(caller); },
          [&](const open_replies_command& op) {
            host.open_replies(caller, op.height, op.member);
          },
          [&](const info_command&) {
            const auto info = host.info();
            out << "info members=" << info.member_count
                << " commitments=" << info.commitment_count
                << " pending_rounds=" << info.pending_rounds
                << " clock=" << info.clock << " timeout=" << info.timeout
                << " quorum=" << info.quorum
                << " quorum_policy=" << to_string(info.quorum_policy)
                << " state_root=" << to_hex(info.state_root) << '\n';
          }},
      command.operation);
}

}  // namespace bulletin::host
