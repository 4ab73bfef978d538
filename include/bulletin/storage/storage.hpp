#pragma once
#include <bulletin/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace bulletin::storage {

using key_value_entry_t =
    std::pair<bulletin::schema::bytes_t, bulletin::schema::bytes_t>;

/// Every record the host writes lives under kStatePrefix.
inline constexpr auto kStatePrefix = std::string_view{"BULLETIN|"};
inline constexpr auto kSnapshotKey = std::string_view{"BULLETIN|STATE"};
inline constexpr auto kCommittedKey = std::string_view{"BULLETIN|COMMITTED"};

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  bulletin::schema::clock_tick_t clock{};
  bulletin::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Load the most recent committed checkpoint (clock + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Load the encoded bulletin snapshot, or std::nullopt on a fresh database.
  std::optional<bulletin::schema::bytes_t> load_state() const;

  /// Atomically persist the encoded snapshot together with its checkpoint.
  void save_state(const bulletin::schema::bytes_t& snapshot,
                  const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const bulletin::schema::bytes_view_t& prefix) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const bulletin::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace bulletin::storage
