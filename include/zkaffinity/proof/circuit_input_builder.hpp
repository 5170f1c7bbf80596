#pragma once

#include <zkaffinity/schema/attestation.hpp>
#include <zkaffinity/schema/circuit_input.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace zkaffinity::proof {

/// Canonicalizes an attestation collection into the fixed-shape input of the
/// threshold circuit.
///
/// Entries without a tag, score or signature, with a score that is not a
/// whole number in [0, kMaxAttestationScore], or flagged as failing
/// verification are dropped. The remaining entries matching `target_tag`
/// fill the score slots in input order; slots past the last match are zero.
/// At most kMaxAttestations entries are kept, and totals cover only those.
///
/// Returns std::nullopt when nothing valid remains. has_valid_proof is 0 when
/// no entry matches the tag, whatever the threshold.
std::optional<zkaffinity::schema::circuit_input_t> prepare_circuit_inputs(
    std::span<const zkaffinity::schema::scored_attestation_t> attestations,
    std::string_view target_tag,
    uint64_t threshold);

std::optional<zkaffinity::schema::circuit_input_t> prepare_circuit_inputs(
    std::span<const zkaffinity::schema::attestation_t> attestations,
    std::string_view target_tag,
    uint64_t threshold);

zkaffinity::schema::scored_attestation_t to_scored_attestation(
    const zkaffinity::schema::attestation_t& record);

/// Dictionary id for `tag`, falling back to kDefaultTagId.
uint8_t resolve_tag_id(std::string_view tag);

}  // namespace zkaffinity::proof
