#pragma once

#include <zkaffinity/attestation/verification.hpp>
#include <zkaffinity/common/error.hpp>
#include <zkaffinity/schema/attestation.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace zkaffinity::attestation {

struct publisher_entry final {
  std::string domain;
  zkaffinity::schema::uncompressed_public_key_t public_key{};
  zkaffinity::schema::address_t address{};
};

using publisher_entry_t = publisher_entry;

struct generated_publisher_key final {
  publisher_entry_t entry;
  // `0x` + 64 hex characters.
  std::string private_key;
};

using generated_publisher_key_t = generated_publisher_key;

/// Trusted publisher keys, keyed by domain.
///
/// The document format is
/// `{"<domain>": {"public_key": "0x04...", "address": "0x..."}, ...}`.
/// `address` is optional; when present it must match the key.
class publisher_registry final {
 public:
  static zkaffinity::common::result_t<publisher_registry> parse(
      std::string_view document);
  static zkaffinity::common::result_t<publisher_registry> load(
      const std::filesystem::path& path);

  void add(publisher_entry_t entry);
  std::optional<publisher_entry_t> find(std::string_view domain) const;
  std::size_t size() const { return entries_.size(); }

  /// Checks `record` against the key registered for `record.publisher`.
  verification_t verify(
      const zkaffinity::schema::attestation_t& record) const noexcept;

  std::string to_json() const;

 private:
  std::map<std::string, publisher_entry_t, std::less<>> entries_;
};

zkaffinity::common::result_t<generated_publisher_key_t> generate_publisher_key(
    std::string domain);

/// Same layout as a registry entry plus `private_key`.
std::string to_json(const generated_publisher_key_t& key);

/// Reads a single-publisher document written by to_json above.
zkaffinity::common::result_t<generated_publisher_key_t> load_publisher_key(
    const std::filesystem::path& path);

}  // namespace zkaffinity::attestation
