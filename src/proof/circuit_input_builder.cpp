#include <zkaffinity/proof/circuit_input_builder.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <vector>

using namespace zkaffinity::schema;

namespace zkaffinity::proof {

namespace {

std::optional<uint64_t> canonical_score(const std::optional<double>& score) {
  if (!score) {
    return std::nullopt;
  }
  auto value = *score;
  if (!std::isfinite(value) || value < 0.0 ||
      value > static_cast<double>(kMaxAttestationScore) ||
      std::trunc(value) != value) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(value);
}

bool is_well_formed(const scored_attestation_t& entry) {
  if (!entry.tag || !entry.signature || entry.signature->empty()) {
    return false;
  }
  if (entry.verified.has_value() && !*entry.verified) {
    return false;
  }
  return canonical_score(entry.score).has_value();
}

}  // namespace

uint8_t resolve_tag_id(const std::string_view tag) {
  auto parsed = try_parse_tag(tag);
  if (!parsed) {
    spdlog::warn("Unknown tag '{}', using default tag id {}", tag,
                 kDefaultTagId);
    return kDefaultTagId;
  }
  return tag_id(*parsed);
}

std::optional<circuit_input_t> prepare_circuit_inputs(
    const std::span<const scored_attestation_t> attestations,
    const std::string_view target_tag,
    const uint64_t threshold) {
  auto valid = std::vector<const scored_attestation_t*>{};
  valid.reserve(attestations.size());
  for (const auto& entry : attestations) {
    if (is_well_formed(entry)) {
      valid.push_back(&entry);
    }
  }
  if (valid.empty()) {
    spdlog::debug("No valid attestations among {} candidates",
                  attestations.size());
    return std::nullopt;
  }

  auto input = circuit_input_t{};
  input.target_tag_id = resolve_tag_id(target_tag);
  input.threshold = threshold;

  for (const auto* entry : valid) {
    if (*entry->tag != target_tag) {
      continue;
    }
    if (input.attestation_count == kMaxAttestations) {
      ++input.truncated_count;
      continue;
    }
    auto score = *canonical_score(entry->score);
    input.scores[input.attestation_count++] = score;
    input.total_score += score;
  }
  if (input.truncated_count > 0) {
    spdlog::warn("Dropped {} {} attestations beyond the {} slot limit",
                 input.truncated_count, target_tag, kMaxAttestations);
  }

  // An empty match set never proves, even against a zero threshold.
  input.has_valid_proof =
      input.attestation_count > 0 && input.total_score >= threshold ? 1 : 0;
  return input;
}

scored_attestation_t to_scored_attestation(const attestation_t& record) {
  return scored_attestation_t{
      .tag = std::string{tag_name(record.tag)},
      .score = static_cast<double>(record.score),
      .signature = bytes_t{std::begin(record.signature),
                           std::end(record.signature)},
      .verified = std::nullopt};
}

std::optional<circuit_input_t> prepare_circuit_inputs(
    const std::span<const attestation_t> attestations,
    const std::string_view target_tag,
    const uint64_t threshold) {
  auto scored = std::vector<scored_attestation_t>{};
  scored.reserve(attestations.size());
  for (const auto& record : attestations) {
    scored.push_back(to_scored_attestation(record));
  }
  return prepare_circuit_inputs(
      std::span<const scored_attestation_t>{scored}, target_tag, threshold);
}

}  // namespace zkaffinity::proof
