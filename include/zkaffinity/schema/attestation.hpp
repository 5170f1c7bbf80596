#pragma once
#include <zkaffinity/schema/primitives.hpp>
#include <zkaffinity/schema/tag.hpp>

#include <cstdint>
#include <string>

// Schema type: attestation.
// Publisher-signed statement binding a subject wallet to an interest tag.
namespace zkaffinity::schema {

inline constexpr auto kMaxAttestationScore = uint32_t{100};
inline constexpr auto kDefaultAttestationScore = uint32_t{1};

template <uint16_t Version>
struct attestation;

template <>
struct attestation<1> final {
  uint16_t version{1};
  // Store-assigned; zero until persisted.
  attestation_id_t id{};
  tag_t tag{tag_t::defi};
  uint32_t score{kDefaultAttestationScore};
  timestamp_seconds_t timestamp{};
  std::string nonce;
  recoverable_signature_t signature{};
  std::string publisher;
  address_t subject_wallet{};
  address_t signer_address{};
  bool consumed{false};
};

using attestation_t = attestation<1>;

}  // namespace zkaffinity::schema
