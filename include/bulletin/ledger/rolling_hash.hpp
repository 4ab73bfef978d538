#pragma once

#include <bulletin/ledger/commitment_store.hpp>
#include <bulletin/schema/commitment.hpp>
#include <bulletin/schema/primitives.hpp>
#include <string>

namespace bulletin::ledger {

/// Chain link following `previous`: hex(siphash13(view ++ rolling_hash)).
std::string chain_rolling_hash(const bulletin::schema::commitment_t& previous);

/// Expected rolling hash for (member, height): derived from the member's own
/// commitment at height - 1, or "None" when there is none.
std::string compute_rolling_hash(const commitment_store& store,
                                 const bulletin::schema::member_id_t& member,
                                 bulletin::schema::height_t height);

}  // namespace bulletin::ledger
