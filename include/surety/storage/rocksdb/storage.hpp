#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <surety/common/critical.hpp>
#include <surety/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace surety::storage {

namespace detail {

inline surety::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const surety::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const surety::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const surety::schema::bytes_view_t& key,
           const T& value) const;

  bool contains(const surety::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const surety::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const surety::schema::bytes_view_t& key) const {
  if (!database) {
    surety::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    surety::common::critical("Failed to get value from RocksDB");
  }
  auto decoded = encoder.template try_decode<T>(surety::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!decoded) {
    surety::common::critical("Failed to decode value stored in RocksDB");
  }
  return decoded;
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const surety::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    surety::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(surety::schema::bytes_view_t{encoded_value.data(),
                                                    encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    surety::common::critical("Failed to put value into RocksDB");
  }
}

inline bool storage<rocksdb_storage_tag>::contains(
    const surety::schema::bytes_view_t& key) const {
  if (!database) {
    surety::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("Failed to probe RocksDB: {}", status.ToString());
    surety::common::critical("Failed to probe RocksDB");
  }
  return true;
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const surety::schema::bytes_view_t& prefix) const {
  if (!database) {
    surety::common::critical("RocksDB database is not initialized");
  }
  auto entries = std::vector<key_value_entry_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  auto prefix_slice = detail::to_slice(prefix);
  for (iterator->Seek(prefix_slice); iterator->Valid(); iterator->Next()) {
    if (!iterator->key().starts_with(prefix_slice)) {
      break;
    }
    entries.emplace_back(detail::to_bytes(iterator->key()),
                         detail::to_bytes(iterator->value()));
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    surety::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace surety::storage
