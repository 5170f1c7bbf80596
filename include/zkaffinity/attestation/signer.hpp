#pragma once

#include <zkaffinity/common/error.hpp>
#include <zkaffinity/crypto/secp256k1.hpp>
#include <zkaffinity/schema/attestation.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace zkaffinity::attestation {

/// Holds one publisher's secp256k1 key and produces signed attestations.
class publisher_signer final {
 public:
  /// `private_key_hex` must be `0x` followed by 64 hex characters.
  static zkaffinity::common::result_t<publisher_signer> make(
      std::string_view private_key_hex,
      std::string publisher_domain);

  static zkaffinity::common::result_t<publisher_signer> make(
      const zkaffinity::crypto::keypair_t& key,
      std::string publisher_domain);

  /// Signs {tag, wallet} under a fresh nonce and the current time. Nothing is
  /// persisted.
  zkaffinity::common::result_t<zkaffinity::schema::attestation_t>
  sign_attestation(
      std::string_view tag,
      std::string_view subject_wallet,
      uint32_t score = zkaffinity::schema::kDefaultAttestationScore) const;

  /// As above with a caller-chosen timestamp.
  zkaffinity::common::result_t<zkaffinity::schema::attestation_t>
  sign_attestation(std::string_view tag,
                   std::string_view subject_wallet,
                   uint32_t score,
                   zkaffinity::schema::timestamp_seconds_t timestamp) const;

  const std::string& publisher() const { return publisher_; }
  const zkaffinity::schema::address_t& address() const { return key_.address; }
  const zkaffinity::schema::uncompressed_public_key_t& public_key() const {
    return key_.public_key;
  }

 private:
  publisher_signer(zkaffinity::crypto::keypair_t key, std::string publisher);

  zkaffinity::crypto::keypair_t key_;
  std::string publisher_;
};

}  // namespace zkaffinity::attestation
