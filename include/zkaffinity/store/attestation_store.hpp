#pragma once

#include <zkaffinity/attestation/publisher_registry.hpp>
#include <zkaffinity/common/error.hpp>
#include <zkaffinity/schema/attestation.hpp>
#include <zkaffinity/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zkaffinity::store {

struct attestation_stats final {
  uint64_t total{};
  uint64_t consumed{};
  std::map<std::string, uint64_t> by_tag;
  uint64_t unique_wallets{};
  uint64_t unique_publishers{};
  std::optional<zkaffinity::schema::timestamp_seconds_t> oldest;
  std::optional<zkaffinity::schema::timestamp_seconds_t> newest;
};

using attestation_stats_t = attestation_stats;

/// Durable attestation collection with nonce-level replay protection.
///
/// Each record is written together with its nonce, wallet and tag index
/// entries in one RocksDB batch, so a reader sees either all of them or
/// none. Reads go through a RocksDB snapshot.
class attestation_store final {
 public:
  using storage_t =
      zkaffinity::storage::storage<zkaffinity::storage::rocksdb_storage_tag>;

  explicit attestation_store(storage_t storage);

  /// Persists `record` and returns the assigned id. A nonce that is already
  /// stored yields duplicate_error and leaves the store untouched.
  zkaffinity::common::result_t<zkaffinity::schema::attestation_id_t>
  store_attestation(const zkaffinity::schema::attestation_t& record);

  /// store_attestation preceded by a signature check against `registry`.
  zkaffinity::common::result_t<zkaffinity::schema::attestation_id_t>
  verify_and_store_attestation(
      const zkaffinity::schema::attestation_t& record,
      const zkaffinity::attestation::publisher_registry& registry);

  /// Newest first: timestamp descending, then id descending.
  zkaffinity::common::result_t<std::vector<zkaffinity::schema::attestation_t>>
  get_attestations(
      std::string_view subject_wallet,
      std::optional<std::string_view> tag_filter = std::nullopt) const;

  zkaffinity::common::result_t<std::vector<zkaffinity::schema::attestation_t>>
  get_attestations(
      const zkaffinity::schema::address_t& subject_wallet,
      std::optional<zkaffinity::schema::tag_t> tag_filter = std::nullopt) const;

  /// Every record carrying `tag` across all wallets, newest first. Reads the
  /// tag index rather than scanning the records.
  zkaffinity::common::result_t<std::vector<zkaffinity::schema::attestation_t>>
  get_attestations_by_tag(std::string_view tag) const;

  zkaffinity::common::result_t<std::vector<zkaffinity::schema::attestation_t>>
  get_attestations_by_tag(zkaffinity::schema::tag_t tag) const;

  zkaffinity::common::result_t<std::optional<zkaffinity::schema::attestation_t>>
  get_attestation(zkaffinity::schema::attestation_id_t id) const;

  /// Best effort. Failures are logged and otherwise ignored.
  void mark_consumed(std::span<const zkaffinity::schema::attestation_id_t> ids);

  zkaffinity::common::result_t<attestation_stats_t> stats() const;

  /// Deletes every record whose timestamp is strictly older than `cutoff`.
  zkaffinity::common::result_t<uint64_t> cleanup_older_than(
      zkaffinity::schema::timestamp_seconds_t cutoff);

 private:
  zkaffinity::common::result_t<zkaffinity::schema::attestation_id_t>
  next_id() const;

  storage_t storage_;
  std::mutex write_mutex_;
};

}  // namespace zkaffinity::store
