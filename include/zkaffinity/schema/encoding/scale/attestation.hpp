#pragma once
#include <zkaffinity/schema/attestation.hpp>

#include <optional>
#include <string>
#include <tuple>

namespace zkaffinity::schema::encoding::scale {

// Persisted column order of an attestation record value. Append new
// columns at the end and bump the version.
using attestation_row_t = std::tuple<uint16_t,                 // version
                                     attestation_id_t,         // id
                                     uint8_t,                  // tag id
                                     uint32_t,                 // score
                                     timestamp_seconds_t,      // timestamp
                                     std::string,              // nonce
                                     recoverable_signature_t,  // signature
                                     std::string,              // publisher
                                     address_t,                // subject
                                     address_t,                // signer
                                     bool>;                    // consumed

attestation_row_t to_row(const attestation_t& o);

/// std::nullopt when the row carries an unknown version or tag id.
std::optional<attestation_t> from_row(const attestation_row_t& row);

}  // namespace zkaffinity::schema::encoding::scale
