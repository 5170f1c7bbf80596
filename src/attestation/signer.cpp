#include <zkaffinity/attestation/canonical_message.hpp>
#include <zkaffinity/attestation/signer.hpp>
#include <zkaffinity/crypto/random.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <utility>

using namespace zkaffinity::common;
using namespace zkaffinity::schema;

namespace zkaffinity::attestation {

publisher_signer::publisher_signer(zkaffinity::crypto::keypair_t key,
                                   std::string publisher)
    : key_{std::move(key)}, publisher_{std::move(publisher)} {}

result_t<publisher_signer> publisher_signer::make(
    const std::string_view private_key_hex,
    std::string publisher_domain) {
  if (private_key_hex.size() != 66 || !private_key_hex.starts_with("0x")) {
    return make_error(error_code::cryptography_error,
                      "Invalid private key format");
  }
  auto raw = try_from_hex(private_key_hex);
  if (!raw || raw->size() != 32) {
    return make_error(error_code::cryptography_error,
                      "Invalid private key format");
  }
  auto scalar = hash32_t{};
  std::ranges::copy(*raw, std::begin(scalar));
  auto key = zkaffinity::crypto::load_private_key(scalar);
  if (!key) {
    return make_error(error_code::cryptography_error,
                      "Private key is not a valid secp256k1 scalar");
  }
  return make(*key, std::move(publisher_domain));
}

result_t<publisher_signer> publisher_signer::make(
    const zkaffinity::crypto::keypair_t& key,
    std::string publisher_domain) {
  if (publisher_domain.empty()) {
    return make_error(error_code::cryptography_error,
                      "Publisher domain is required");
  }
  spdlog::debug("Loaded signing key {} for publisher {}", to_hex(key.address),
                publisher_domain);
  return publisher_signer{key, std::move(publisher_domain)};
}

result_t<attestation_t> publisher_signer::sign_attestation(
    const std::string_view tag,
    const std::string_view subject_wallet,
    const uint32_t score) const {
  auto now = std::chrono::duration_cast<std::chrono::seconds>(
                 std::chrono::system_clock::now().time_since_epoch())
                 .count();
  return sign_attestation(tag, subject_wallet, score,
                          static_cast<timestamp_seconds_t>(now));
}

result_t<attestation_t> publisher_signer::sign_attestation(
    const std::string_view tag,
    const std::string_view subject_wallet,
    const uint32_t score,
    const timestamp_seconds_t timestamp) const {
  auto parsed_tag = try_parse_tag(tag);
  if (!parsed_tag) {
    return make_error(error_code::validation_error,
                      "Unsupported tag: " + std::string{tag} + " (expected " +
                          join_names(kTagNames) + ")");
  }
  auto wallet = try_make_address(subject_wallet);
  if (!wallet) {
    return make_error(error_code::validation_error,
                      "Invalid wallet address format");
  }
  if (score > kMaxAttestationScore) {
    return make_error(error_code::validation_error,
                      "Score exceeds the maximum of " +
                          std::to_string(kMaxAttestationScore));
  }
  auto nonce = zkaffinity::crypto::make_nonce();
  if (!nonce) {
    return make_error(error_code::cryptography_error,
                      "Failed to draw a nonce");
  }

  auto record = attestation_t{};
  record.tag = *parsed_tag;
  record.score = score;
  record.timestamp = timestamp;
  record.nonce = std::move(*nonce);
  record.publisher = publisher_;
  record.subject_wallet = *wallet;
  record.signer_address = key_.address;

  auto digest = zkaffinity::crypto::message_digest(canonical_message(record));
  if (!digest) {
    return make_error(error_code::cryptography_error,
                      "KECCAK-256 is not available in this OpenSSL");
  }
  auto signature = zkaffinity::crypto::sign_recoverable(key_, *digest);
  if (!signature) {
    return make_error(error_code::cryptography_error,
                      "Failed to sign attestation");
  }
  record.signature = *signature;

  spdlog::debug("Signed {} attestation for {} by {}", tag,
                to_hex(record.subject_wallet), publisher_);
  return record;
}

}  // namespace zkaffinity::attestation
