#include <bulletin/ledger/commitment_store.hpp>

#include <utility>

using namespace bulletin::schema;

namespace bulletin::ledger {

void commitment_store::register_member(const member_id_t& member) {
  commitments_.try_emplace(member);
}

void commitment_store::purge_member(const member_id_t& member) {
  commitments_.erase(member);
}

const commitment_t* commitment_store::find(const member_id_t& member,
                                           const height_t height) const {
  auto per_member = commitments_.find(member);
  if (per_member == std::end(commitments_)) {
    return nullptr;
  }
  auto entry = per_member->second.find(height);
  if (entry == std::end(per_member->second)) {
    return nullptr;
  }
  return &entry->second;
}

std::optional<commitment_t> commitment_store::get(const member_id_t& member,
                                                  const height_t height) const {
  if (const auto* found = find(member, height)) {
    return *found;
  }
  return std::nullopt;
}

bool commitment_store::try_insert(const member_id_t& member,
                                  const height_t height,
                                  commitment_t commitment) {
  auto per_member = commitments_.find(member);
  if (per_member == std::end(commitments_)) {
    return false;
  }
  return per_member->second.try_emplace(height, std::move(commitment)).second;
}

std::vector<commitment_t> commitment_store::all_commitments_at(
    const height_t height,
    const std::vector<member_id_t>& members) const {
  auto result = std::vector<commitment_t>{};
  for (const auto& member : members) {
    if (const auto* found = find(member, height)) {
      result.push_back(*found);
    }
  }
  return result;
}

std::size_t commitment_store::size() const {
  auto count = std::size_t{0};
  for (const auto& [member, per_height] : commitments_) {
    count += per_height.size();
  }
  return count;
}

std::vector<commitment_record_t> commitment_store::export_records(
    const std::vector<member_id_t>& members) const {
  auto records = std::vector<commitment_record_t>{};
  for (const auto& member : members) {
    auto per_member = commitments_.find(member);
    if (per_member == std::end(commitments_)) {
      continue;
    }
    for (const auto& [height, commitment] : per_member->second) {
      records.push_back(commitment_record_t{
          .member = member, .height = height, .commitment = commitment});
    }
  }
  return records;
}

void commitment_store::import_records(
    const std::vector<member_id_t>& members,
    const std::vector<commitment_record_t>& records) {
  commitments_.clear();
  for (const auto& member : members) {
    register_member(member);
  }
  for (const auto& record : records) {
    try_insert(record.member, record.height, record.commitment);
  }
}

}  // namespace bulletin::ledger
