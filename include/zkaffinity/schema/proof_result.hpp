#pragma once
#include <zkaffinity/common/error.hpp>
#include <zkaffinity/schema/primitives.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace zkaffinity::schema {

// Positional layout verifiers parse without field names:
// [targetTagId, threshold, validityFlag]
using public_signals_t = std::array<uint64_t, 3>;

inline constexpr auto kPublicSignalTargetTag = std::size_t{0};
inline constexpr auto kPublicSignalThreshold = std::size_t{1};
inline constexpr auto kPublicSignalValidity = std::size_t{2};

struct proof_metadata final {
  std::string tag;
  uint64_t threshold{};
  uint64_t total_score{};
  std::size_t attestation_count{};
  timestamp_seconds_t timestamp{};
};

struct proof_result final {
  bool success{false};
  std::optional<bytes_t> proof;
  std::optional<public_signals_t> public_signals;
  std::optional<zkaffinity::common::error_t> error;
  proof_metadata metadata;
};

using proof_metadata_t = proof_metadata;
using proof_result_t = proof_result;

}  // namespace zkaffinity::schema
