#include <zkaffinity/attestation/canonical_message.hpp>
#include <zkaffinity/attestation/verification.hpp>
#include <zkaffinity/crypto/secp256k1.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <optional>

using namespace zkaffinity::schema;

namespace zkaffinity::attestation {

namespace {

constexpr auto kEmptyAddress = address_t{};
constexpr auto kEmptySignature = recoverable_signature_t{};

bool has_required_fields(const attestation_t& record) {
  return record.timestamp != 0 && !record.nonce.empty() &&
         !record.publisher.empty() && record.subject_wallet != kEmptyAddress &&
         record.signature != kEmptySignature;
}

bool has_recovery_byte(const recoverable_signature_t& signature) {
  auto v = signature[64];
  return v == 0 || v == 1 || v == 27 || v == 28;
}

std::optional<address_t> resolve_expected_signer(const std::string_view value) {
  if (is_address(value)) {
    return try_make_address(value);
  }
  auto raw = try_from_hex(value);
  if (!raw) {
    return std::nullopt;
  }
  auto public_key = zkaffinity::crypto::parse_public_key(make_bytes_view(*raw));
  if (!public_key) {
    return std::nullopt;
  }
  return zkaffinity::crypto::address_from_public_key(*public_key);
}

verification_t check_signature(const attestation_t& record,
                               const address_t& expected) {
  if (!has_required_fields(record)) {
    return {.valid = false, .reason = verification_reason::missing_field};
  }
  if (!has_recovery_byte(record.signature)) {
    return {.valid = false, .reason = verification_reason::malformed_signature};
  }
  auto digest = zkaffinity::crypto::message_digest(canonical_message(record));
  if (!digest) {
    return {.valid = false, .reason = verification_reason::recovery_failed};
  }
  auto recovered =
      zkaffinity::crypto::recover_public_key(*digest, record.signature);
  if (!recovered) {
    return {.valid = false, .reason = verification_reason::recovery_failed};
  }
  auto recovered_address = zkaffinity::crypto::address_from_public_key(*recovered);
  if (!recovered_address) {
    return {.valid = false, .reason = verification_reason::recovery_failed};
  }
  if (*recovered_address != expected) {
    return {.valid = false, .reason = verification_reason::signer_mismatch};
  }
  return {.valid = true, .reason = verification_reason::ok};
}

}  // namespace

verification_t verify_attestation(const attestation_t& record,
                                  const std::string_view expected_signer) noexcept {
  try {
    if (!has_required_fields(record)) {
      return {.valid = false, .reason = verification_reason::missing_field};
    }
    auto expected = resolve_expected_signer(expected_signer);
    if (!expected) {
      return {.valid = false,
              .reason = verification_reason::malformed_expected_signer};
    }
    return check_signature(record, *expected);
  } catch (const std::exception& e) {
    spdlog::warn("Attestation verification failed: {}", e.what());
    return {.valid = false, .reason = verification_reason::recovery_failed};
  }
}

verification_t verify_attestation(const attestation_t& record,
                                  const address_t& expected_signer) noexcept {
  try {
    return check_signature(record, expected_signer);
  } catch (const std::exception& e) {
    spdlog::warn("Attestation verification failed: {}", e.what());
    return {.valid = false, .reason = verification_reason::recovery_failed};
  }
}

}  // namespace zkaffinity::attestation
