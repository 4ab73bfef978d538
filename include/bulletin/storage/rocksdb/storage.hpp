#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <bulletin/common/critical.hpp>
#include <bulletin/schema/encoding/scale/encoder.hpp>
#include <bulletin/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace bulletin::storage {

namespace detail {

using encoder_t = bulletin::schema::encoding::encoder<
    bulletin::schema::encoding::scale_encoder_tag>;

inline bulletin::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline bulletin::schema::bytes_t to_bytes(const std::string_view& value) {
  return {reinterpret_cast<const uint8_t*>(value.data()),
          reinterpret_cast<const uint8_t*>(value.data()) + value.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<committed_state> load_committed_state() const;
  std::optional<bulletin::schema::bytes_t> load_state() const;
  void save_state(const bulletin::schema::bytes_t& snapshot,
                  const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const bulletin::schema::bytes_view_t& prefix) const;
  void replace_by_prefix(const bulletin::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    bulletin::common::critical("RocksDB database is not initialized");
  }

  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{kCommittedKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    spdlog::error("Failed to load committed state: {}",
                  committed_status.ToString());
    bulletin::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<
      std::tuple<bulletin::schema::clock_tick_t, bulletin::schema::hash32_t>>(
      bulletin::schema::bytes_view_t{
          reinterpret_cast<const uint8_t*>(committed_raw.data()),
          committed_raw.size()});
  if (!decoded.has_value()) {
    bulletin::common::critical("failed to decode committed state");
  }

  auto state = committed_state{};
  state.clock = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  return state;
}

inline std::optional<bulletin::schema::bytes_t>
storage<rocksdb_storage_tag>::load_state() const {
  if (!database) {
    bulletin::common::critical("RocksDB database is not initialized");
  }
  auto raw_value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              std::string{kSnapshotKey}, &raw_value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to load bulletin state: {}", status.ToString());
    bulletin::common::critical("failed to load bulletin state");
  }
  return bulletin::schema::bytes_t(std::begin(raw_value), std::end(raw_value));
}

inline void storage<rocksdb_storage_tag>::save_state(
    const bulletin::schema::bytes_t& snapshot,
    const committed_state& state) const {
  auto encoder = detail::encoder_t{};
  auto encoded_state = encoder.encode(std::tuple{state.clock, state.state_root});
  auto entries = std::vector<key_value_entry_t>{
      key_value_entry_t{detail::to_bytes(kSnapshotKey), snapshot},
      key_value_entry_t{detail::to_bytes(kCommittedKey),
                        std::move(encoded_state)}};
  replace_by_prefix(
      bulletin::schema::bytes_view_t{
          reinterpret_cast<const uint8_t*>(kStatePrefix.data()),
          kStatePrefix.size()},
      entries);
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const bulletin::schema::bytes_view_t& prefix) const {
  if (!database) {
    bulletin::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::replace_by_prefix(
    const bulletin::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    bulletin::common::critical("RocksDB database is not initialized");
  }

  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};

  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    auto delete_status = batch.Delete(iterator->key());
    if (!delete_status.ok()) {
      bulletin::common::critical(
          "failed deleting key during prefix replacement");
    }
    iterator->Next();
  }

  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(key.data()),
                                 key.size()},
        ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(value.data()),
                                 value.size()});
    if (!put_status.ok()) {
      bulletin::common::critical(
          "failed writing key during prefix replacement");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("RocksDB batch write failed: {}", write_status.ToString());
    bulletin::common::critical("failed to commit prefix replacement");
  }
}

}  // namespace bulletin::storage
