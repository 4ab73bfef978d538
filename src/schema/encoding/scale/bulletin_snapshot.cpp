#include <bulletin/schema/encoding/scale/bulletin_snapshot.hpp>
#include <bulletin/schema/encoding/scale/encoder.hpp>

#include <iterator>
#include <tuple>
#include <utility>

using namespace bulletin::schema;

namespace {

using encoder_t = bulletin::schema::encoding::encoder<
    bulletin::schema::encoding::scale_encoder_tag>;

using commitment_row_t =
    std::tuple<member_id_t, height_t, bytes_t, std::string>;
using round_row_t =
    std::tuple<member_id_t, height_t, bytes_t, std::string, clock_tick_t>;
using reply_row_t = std::tuple<member_id_t,
                               height_t,
                               std::vector<std::string>,
                               std::optional<round_row_t>>;
using snapshot_row_t = std::tuple<uint16_t,
                                  clock_tick_t,
                                  clock_tick_t,
                                  std::vector<member_id_t>,
                                  std::vector<commitment_row_t>,
                                  std::vector<reply_row_t>>;

round_row_t to_row(const approval_round_t& round) {
  return round_row_t{round.proposer, round.height, round.view,
                     round.rolling_hash, round.initial_clock};
}

approval_round_t from_row(const round_row_t& row) {
  return approval_round_t{.proposer = std::get<0>(row),
                          .height = std::get<1>(row),
                          .view = std::get<2>(row),
                          .rolling_hash = std::get<3>(row),
                          .initial_clock = std::get<4>(row)};
}

}  // namespace

namespace bulletin::schema::encoding::scale {

bytes_t encode(const bulletin_snapshot<1>& snapshot) {
  auto commitments = std::vector<commitment_row_t>{};
  commitments.reserve(snapshot.commitments.size());
  for (const auto& record : snapshot.commitments) {
    commitments.emplace_back(record.member, record.height,
                             record.commitment.view,
                             record.commitment.rolling_hash);
  }

  auto replies = std::vector<reply_row_t>{};
  replies.reserve(snapshot.replies.size());
  for (const auto& record : snapshot.replies) {
    auto round = std::optional<round_row_t>{};
    if (record.round) {
      round = to_row(*record.round);
    }
    replies.emplace_back(record.member, record.height, record.replies,
                         std::move(round));
  }

  auto encoder = encoder_t{};
  return encoder.encode(snapshot_row_t{snapshot.version, snapshot.clock,
                                       snapshot.timeout, snapshot.whitelist,
                                       commitments, replies});
}

std::optional<bulletin_snapshot<1>> try_decode_snapshot(
    const bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<snapshot_row_t>(bytes);
  if (!decoded.has_value() || std::get<0>(*decoded) != 1) {
    return std::nullopt;
  }

  auto snapshot = bulletin_snapshot_t{};
  snapshot.clock = std::get<1>(*decoded);
  snapshot.timeout = std::get<2>(*decoded);
  snapshot.whitelist = std::move(std::get<3>(*decoded));
  for (auto& [member, height, view, rolling_hash] : std::get<4>(*decoded)) {
    snapshot.commitments.push_back(commitment_record_t{
        .member = member,
        .height = height,
        .commitment = commitment_t{.view = std::move(view),
                                   .rolling_hash = std::move(rolling_hash)}});
  }
  for (auto& [member, height, replies, round] : std::get<5>(*decoded)) {
    auto record = reply_record_t{.member = member,
                                 .height = height,
                                 .replies = std::move(replies),
                                 .round = std::nullopt};
    if (round) {
      record.round = from_row(*round);
    }
    snapshot.replies.push_back(std::move(record));
  }
  return snapshot;
}

}  // namespace bulletin::schema::encoding::scale
