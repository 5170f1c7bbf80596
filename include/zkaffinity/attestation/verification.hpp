#pragma once

#include <zkaffinity/schema/attestation.hpp>
#include <zkaffinity/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace zkaffinity::attestation {

enum class verification_reason : uint8_t {
  ok = 0,
  missing_field = 1,
  malformed_signature = 2,
  malformed_expected_signer = 3,
  recovery_failed = 4,
  signer_mismatch = 5,
  unknown_publisher = 6
};

inline constexpr auto kVerificationReasonNames =
    std::array<std::pair<std::string_view, verification_reason>, 7>{{
        {"ok", verification_reason::ok},
        {"missing_field", verification_reason::missing_field},
        {"malformed_signature", verification_reason::malformed_signature},
        {"malformed_expected_signer",
         verification_reason::malformed_expected_signer},
        {"recovery_failed", verification_reason::recovery_failed},
        {"signer_mismatch", verification_reason::signer_mismatch},
        {"unknown_publisher", verification_reason::unknown_publisher},
    }};

constexpr std::string_view to_string(const verification_reason reason) {
  return zkaffinity::schema::to_string(reason, kVerificationReasonNames)
      .value_or("unknown");
}

struct verification final {
  bool valid{false};
  verification_reason reason{verification_reason::missing_field};
};

using verification_t = verification;

/// Recovers the signer of `record` and compares it with `expected_signer`,
/// given either as a `0x` address or as a hex SEC1 public key. Never throws.
verification_t verify_attestation(const zkaffinity::schema::attestation_t& record,
                                  std::string_view expected_signer) noexcept;

verification_t verify_attestation(
    const zkaffinity::schema::attestation_t& record,
    const zkaffinity::schema::address_t& expected_signer) noexcept;

}  // namespace zkaffinity::attestation
