#include <bulletin/ledger/reply_tracker.hpp>

#include <utility>

using namespace bulletin::schema;

namespace bulletin::ledger {

void reply_tracker::register_member(const member_id_t& member) {
  replies_.try_emplace(member);
}

void reply_tracker::purge_member(const member_id_t& member) {
  replies_.erase(member);
}

reply_collection_t* reply_tracker::find(const member_id_t& member,
                                        const height_t height) {
  auto per_member = replies_.find(member);
  if (per_member == std::end(replies_)) {
    return nullptr;
  }
  auto entry = per_member->second.find(height);
  if (entry == std::end(per_member->second)) {
    return nullptr;
  }
  return &entry->second;
}

const reply_collection_t* reply_tracker::find(const member_id_t& member,
                                              const height_t height) const {
  auto per_member = replies_.find(member);
  if (per_member == std::end(replies_)) {
    return nullptr;
  }
  auto entry = per_member->second.find(height);
  if (entry == std::end(per_member->second)) {
    return nullptr;
  }
  return &entry->second;
}

reply_collection_t* reply_tracker::open(const member_id_t& member,
                                        const height_t height) {
  auto per_member = replies_.find(member);
  if (per_member == std::end(replies_)) {
    return nullptr;
  }
  return &per_member->second[height];
}

bool reply_tracker::append(const member_id_t& member,
                           const height_t height,
                           std::string verdict) {
  auto* collection = find(member, height);
  if (collection == nullptr) {
    return false;
  }
  collection->replies.push_back(std::move(verdict));
  return true;
}

void reply_tracker::discard(const member_id_t& member, const height_t height) {
  auto per_member = replies_.find(member);
  if (per_member != std::end(replies_)) {
    per_member->second.erase(height);
  }
}

std::vector<coordinate_t> reply_tracker::pending_rounds(
    const std::vector<member_id_t>& members) const {
  auto pending = std::vector<coordinate_t>{};
  for (const auto& member : members) {
    auto per_member = replies_.find(member);
    if (per_member == std::end(replies_)) {
      continue;
    }
    for (const auto& [height, collection] : per_member->second) {
      if (collection.round) {
        pending.emplace_back(member, height);
      }
    }
  }
  return pending;
}

std::vector<reply_record_t> reply_tracker::export_records(
    const std::vector<member_id_t>& members) const {
  auto records = std::vector<reply_record_t>{};
  for (const auto& member : members) {
    auto per_member = replies_.find(member);
    if (per_member == std::end(replies_)) {
      continue;
    }
    for (const auto& [height, collection] : per_member->second) {
      records.push_back(reply_record_t{.member = member,
                                       .height = height,
                                       .replies = collection.replies,
                                       .round = collection.round});
    }
  }
  return records;
}

void reply_tracker::import_records(const std::vector<member_id_t>& members,
                                   const std::vector<reply_record_t>& records) {
  replies_.clear();
  for (const auto& member : members) {
    register_member(member);
  }
  for (const auto& record : records) {
    auto* collection = open(record.member, record.height);
    if (collection == nullptr) {
      continue;
    }
    collection->replies = record.replies;
    collection->round = record.round;
  }
}

}  // namespace bulletin::ledger
