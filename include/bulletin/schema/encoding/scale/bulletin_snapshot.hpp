#pragma once
#include <bulletin/schema/bulletin_snapshot.hpp>
#include <optional>

namespace bulletin::schema::encoding::scale {

/// SCALE bytes of a snapshot; layout is a versioned tuple of std containers.
bulletin::schema::bytes_t encode(const bulletin_snapshot<1>& snapshot);

/// Decode snapshot bytes; std::nullopt for malformed input or an unknown
/// snapshot version.
std::optional<bulletin_snapshot<1>> try_decode_snapshot(
    const bulletin::schema::bytes_view_t& bytes);

}  // namespace bulletin::schema::encoding::scale
