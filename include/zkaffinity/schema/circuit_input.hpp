#pragma once
#include <zkaffinity/schema/primitives.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace zkaffinity::schema {

// Must match ThresholdProof(50) in the compiled circuit.
inline constexpr auto kMaxAttestations = std::size_t{50};

/// Loosely-typed view of an attestation as handed to the input builder.
///
/// Every field may be absent so that untrusted collections can be
/// canonicalized without a separate parsing pass.
struct scored_attestation final {
  std::optional<std::string> tag;
  std::optional<double> score;
  std::optional<bytes_t> signature;
  // Upstream verification verdict, when one was computed.
  std::optional<bool> verified;
};

using scored_attestation_t = scored_attestation;

struct circuit_input final {
  std::array<uint64_t, kMaxAttestations> scores{};
  uint8_t target_tag_id{};
  uint64_t threshold{};
  uint64_t total_score{};
  uint8_t has_valid_proof{};
  // Matching attestations that occupy a slot.
  std::size_t attestation_count{};
  // Matching attestations dropped because every slot was taken.
  std::size_t truncated_count{};
};

using circuit_input_t = circuit_input;

}  // namespace zkaffinity::schema
