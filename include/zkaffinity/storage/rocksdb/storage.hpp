#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <zkaffinity/schema/encoding/scale/encoder.hpp>
#include <zkaffinity/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace zkaffinity::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const zkaffinity::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline zkaffinity::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

zkaffinity::common::result_t<std::optional<zkaffinity::schema::bytes_t>>
get_value(ROCKSDB_NAMESPACE::DB* database,
          const ROCKSDB_NAMESPACE::ReadOptions& options,
          const zkaffinity::schema::bytes_view_t& key);

zkaffinity::common::result_t<std::vector<key_value_entry_t>> scan_prefix(
    ROCKSDB_NAMESPACE::DB* database,
    const ROCKSDB_NAMESPACE::ReadOptions& options,
    const zkaffinity::schema::bytes_view_t& prefix);

template <typename T, typename Encoder>
zkaffinity::common::result_t<std::optional<T>> decode_value(
    Encoder& encoder,
    const zkaffinity::common::result_t<
        std::optional<zkaffinity::schema::bytes_t>>& raw) {
  if (zkaffinity::common::has_error(raw)) {
    return zkaffinity::common::get_error(raw);
  }
  const auto& value = zkaffinity::common::get_value(raw);
  if (!value) {
    return std::optional<T>{};
  }
  auto decoded = encoder.template try_decode<T>(
      zkaffinity::schema::bytes_view_t{value->data(), value->size()});
  if (!decoded) {
    return zkaffinity::common::make_error(
        zkaffinity::common::error_code::database_error,
        "Stored value failed to decode");
  }
  return decoded;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct read_view<rocksdb_storage_tag> final {
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  const ROCKSDB_NAMESPACE::Snapshot* handle{nullptr};

  explicit read_view(ROCKSDB_NAMESPACE::DB* db);
  ~read_view();
  read_view(const read_view&) = delete;
  read_view& operator=(const read_view&) = delete;

  zkaffinity::common::result_t<std::optional<zkaffinity::schema::bytes_t>> get(
      const zkaffinity::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  zkaffinity::common::result_t<std::optional<T>> get(
      Encoder& encoder,
      const zkaffinity::schema::bytes_view_t& key) const {
    return detail::decode_value<T>(encoder, get(key));
  }

  zkaffinity::common::result_t<std::vector<key_value_entry_t>> list_by_prefix(
      const zkaffinity::schema::bytes_view_t& prefix) const;

 private:
  ROCKSDB_NAMESPACE::ReadOptions options() const;
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  zkaffinity::common::result_t<std::optional<zkaffinity::schema::bytes_t>> get(
      const zkaffinity::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  zkaffinity::common::result_t<std::optional<T>> get(
      Encoder& encoder,
      const zkaffinity::schema::bytes_view_t& key) const {
    return detail::decode_value<T>(encoder, get(key));
  }

  zkaffinity::common::result_t<std::vector<key_value_entry_t>> list_by_prefix(
      const zkaffinity::schema::bytes_view_t& prefix) const;

  zkaffinity::common::status_t commit(const write_batch& batch) const;

  read_view<rocksdb_storage_tag> snapshot() const;
};

template <>
zkaffinity::common::result_t<storage<rocksdb_storage_tag>>
make_storage<rocksdb_storage_tag>(const std::string_view& path);

}  // namespace zkaffinity::storage
