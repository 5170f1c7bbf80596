#pragma once
#include <zkaffinity/common/error.hpp>
#include <zkaffinity/schema/primitives.hpp>

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace zkaffinity::storage {

using key_value_entry_t =
    std::pair<zkaffinity::schema::bytes_t, zkaffinity::schema::bytes_t>;

/// Mutations committed together or not at all.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<zkaffinity::schema::bytes_t> deletes;
};

template <typename Library>
struct read_view;

template <typename Library>
struct storage {
  /// Return the raw value at key, or std::nullopt when missing.
  zkaffinity::common::result_t<std::optional<zkaffinity::schema::bytes_t>> get(
      const zkaffinity::schema::bytes_view_t& key) const;

  /// Decode and return the value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  zkaffinity::common::result_t<std::optional<T>> get(
      Encoder& encoder,
      const zkaffinity::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  zkaffinity::common::result_t<std::vector<key_value_entry_t>> list_by_prefix(
      const zkaffinity::schema::bytes_view_t& prefix) const;

  /// Apply every put and delete atomically.
  zkaffinity::common::status_t commit(const write_batch& batch) const;

  /// Point-in-time view; reads through it never observe later commits.
  read_view<Library> snapshot() const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
zkaffinity::common::result_t<storage<Library>> make_storage(
    const std::string_view& path);

}  // namespace zkaffinity::storage
