#pragma once

#include <bulletin/schema/primitives.hpp>
#include <cstddef>
#include <vector>

namespace bulletin::ledger {

/// Committee whitelist in insertion order. Privilege checks are the caller's
/// concern; the registry only enforces set semantics.
class membership_registry final {
 public:
  bool contains(const bulletin::schema::member_id_t& member) const;

  /// Append member; false when already present.
  bool add(const bulletin::schema::member_id_t& member);

  /// Remove member; false when absent.
  bool remove(const bulletin::schema::member_id_t& member);

  const std::vector<bulletin::schema::member_id_t>& members() const;
  std::size_t size() const;

  /// Replace the whole whitelist (snapshot import).
  void assign(std::vector<bulletin::schema::member_id_t> members);

 private:
  std::vector<bulletin::schema::member_id_t> whitelist_;
};

}  // namespace bulletin::ledger
