#include <bulletin/ledger/membership_registry.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

using namespace bulletin::schema;

namespace bulletin::ledger {

bool membership_registry::contains(const member_id_t& member) const {
  return std::find(std::begin(whitelist_), std::end(whitelist_), member) !=
         std::end(whitelist_);
}

bool membership_registry::add(const member_id_t& member) {
  if (contains(member)) {
    return false;
  }
  whitelist_.push_back(member);
  return true;
}

bool membership_registry::remove(const member_id_t& member) {
  auto it = std::find(std::begin(whitelist_), std::end(whitelist_), member);
  if (it == std::end(whitelist_)) {
    return false;
  }
  whitelist_.erase(it);
  return true;
}

const std::vector<member_id_t>& membership_registry::members() const {
  return whitelist_;
}

std::size_t membership_registry::size() const {
  return whitelist_.size();
}

void membership_registry::assign(std::vector<member_id_t> members) {
  whitelist_.clear();
  for (auto& member : members) {
    if (!contains(member)) {
      whitelist_.push_back(std::move(member));
    }
  }
}

}  // namespace bulletin::ledger
