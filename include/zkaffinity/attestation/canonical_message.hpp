#pragma once

#include <zkaffinity/schema/attestation.hpp>

#include <string>
#include <string_view>

namespace zkaffinity::attestation {

/// Compact JSON of {nonce, publisherDomain, tag, timestamp, userWallet} with
/// keys in lexicographic order. Signer and verifier must agree byte for byte,
/// so the wallet is always rendered as lowercase hex.
std::string canonical_message(std::string_view nonce,
                              std::string_view publisher,
                              zkaffinity::schema::tag_t tag,
                              zkaffinity::schema::timestamp_seconds_t timestamp,
                              const zkaffinity::schema::address_t& wallet);

std::string canonical_message(const zkaffinity::schema::attestation_t& record);

}  // namespace zkaffinity::attestation
