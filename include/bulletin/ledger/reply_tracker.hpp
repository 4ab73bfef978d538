#pragma once

#include <bulletin/schema/approval_round.hpp>
#include <bulletin/schema/bulletin_snapshot.hpp>
#include <bulletin/schema/primitives.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bulletin::ledger {

/// Replies cast on one (member, height) coordinate plus the approval round
/// suspended on it, if any.
struct reply_collection_t final {
  std::vector<std::string> replies;
  std::optional<bulletin::schema::approval_round_t> round;
};

using coordinate_t =
    std::pair<bulletin::schema::member_id_t, bulletin::schema::height_t>;

class reply_tracker final {
 public:
  void register_member(const bulletin::schema::member_id_t& member);
  void purge_member(const bulletin::schema::member_id_t& member);

  reply_collection_t* find(const bulletin::schema::member_id_t& member,
                           bulletin::schema::height_t height);
  const reply_collection_t* find(const bulletin::schema::member_id_t& member,
                                 bulletin::schema::height_t height) const;

  /// Existing collection for the coordinate, or a new empty one. Returns
  /// nullptr when the member is not registered.
  reply_collection_t* open(const bulletin::schema::member_id_t& member,
                           bulletin::schema::height_t height);

  /// Append a verdict; false when no collection is open at the coordinate.
  bool append(const bulletin::schema::member_id_t& member,
              bulletin::schema::height_t height,
              std::string verdict);

  /// Forget replies and round of one coordinate.
  void discard(const bulletin::schema::member_id_t& member,
               bulletin::schema::height_t height);

  /// Coordinates holding a suspended round, members in the order given.
  std::vector<coordinate_t> pending_rounds(
      const std::vector<bulletin::schema::member_id_t>& members) const;

  std::vector<bulletin::schema::reply_record_t> export_records(
      const std::vector<bulletin::schema::member_id_t>& members) const;
  void import_records(
      const std::vector<bulletin::schema::member_id_t>& members,
      const std::vector<bulletin::schema::reply_record_t>& records);

 private:
  std::map<bulletin::schema::member_id_t,
           std::map<bulletin::schema::height_t, reply_collection_t>>
      replies_;
};

}  // namespace bulletin::ledger
