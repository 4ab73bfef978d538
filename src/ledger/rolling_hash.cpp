#include <bulletin/hash/siphash.hpp>
#include <bulletin/ledger/rolling_hash.hpp>

#include <limits>

using namespace bulletin::schema;

namespace bulletin::ledger {

std::string chain_rolling_hash(const commitment_t& previous) {
  auto hasher = bulletin::hash::siphash13{};
  hasher.update(bytes_view_t{previous.view.data(), previous.view.size()});
  hasher.update(std::string_view{previous.rolling_hash});
  return bulletin::hash::to_hex_string(hasher.finish());
}

std::string compute_rolling_hash(const commitment_store& store,
                                 const member_id_t& member,
                                 const height_t height) {
  if (height == std::numeric_limits<height_t>::min()) {
    return std::string{kGenesisRollingHash};
  }
  const auto* previous = store.find(member, height - 1);
  if (previous == nullptr) {
    return std::string{kGenesisRollingHash};
  }
  return chain_rolling_hash(*previous);
}

}  // namespace bulletin::ledger
