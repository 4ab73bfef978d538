#pragma once

#include <bulletin/schema/bulletin_snapshot.hpp>
#include <bulletin/schema/commitment.hpp>
#include <bulletin/schema/primitives.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace bulletin::ledger {

/// Per-member, per-height storage of published commitments.
///
/// A coordinate (member, height) holds at most one commitment for its whole
/// lifetime; only purging the member removes it.
class commitment_store final {
 public:
  /// Create the (empty) commitment map of a newly admitted member.
  void register_member(const bulletin::schema::member_id_t& member);

  /// Drop every commitment of a removed member.
  void purge_member(const bulletin::schema::member_id_t& member);

  const bulletin::schema::commitment_t* find(
      const bulletin::schema::member_id_t& member,
      bulletin::schema::height_t height) const;

  std::optional<bulletin::schema::commitment_t> get(
      const bulletin::schema::member_id_t& member,
      bulletin::schema::height_t height) const;

  /// Insert unless the member is unknown or the coordinate is taken.
  bool try_insert(const bulletin::schema::member_id_t& member,
                  bulletin::schema::height_t height,
                  bulletin::schema::commitment_t commitment);

  /// Commitments of all listed members at height, in the order given.
  std::vector<bulletin::schema::commitment_t> all_commitments_at(
      bulletin::schema::height_t height,
      const std::vector<bulletin::schema::member_id_t>& members) const;

  std::size_t size() const;

  std::vector<bulletin::schema::commitment_record_t> export_records(
      const std::vector<bulletin::schema::member_id_t>& members) const;
  void import_records(
      const std::vector<bulletin::schema::member_id_t>& members,
      const std::vector<bulletin::schema::commitment_record_t>& records);

 private:
  std::map<bulletin::schema::member_id_t,
           std::map<bulletin::schema::height_t, bulletin::schema::commitment_t>>
      commitments_;
};

}  // namespace bulletin::ledger
