#pragma once

#include <zkaffinity/schema/attestation.hpp>
#include <zkaffinity/schema/circuit_input.hpp>
#include <zkaffinity/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace zkaffinity::testing {

// Fixed scalar so signatures are reproducible across runs.
inline constexpr auto kPublisherKeyHex = std::string_view{
    "0xa1b2c3d4a1b2c3d4a1b2c3d4a1b2c3d4a1b2c3d4a1b2c3d4a1b2c3d4a1b2c3d4"};
inline constexpr auto kOtherPublisherKeyHex = std::string_view{
    "0x0f1e2d3c0f1e2d3c0f1e2d3c0f1e2d3c0f1e2d3c0f1e2d3c0f1e2d3c0f1e2d3c"};
inline constexpr auto kWallet =
    std::string_view{"0x1234567890abcdef1234567890abcdef12345678"};
inline constexpr auto kOtherWallet =
    std::string_view{"0xabcdefabcdefabcdefabcdefabcdefabcdefabcd"};

inline zkaffinity::schema::address_t make_address(const uint8_t seed) {
  auto out = zkaffinity::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline zkaffinity::schema::scored_attestation_t make_scored(
    const std::string_view tag,
    const std::optional<double> score) {
  return zkaffinity::schema::scored_attestation_t{
      .tag = std::string{tag},
      .score = score,
      .signature = zkaffinity::schema::bytes_t{0x01, 0x02, 0x03},
      .verified = std::nullopt};
}

/// Structurally complete record with a placeholder signature; enough for the
/// store, which does not check signatures itself.
inline zkaffinity::schema::attestation_t make_record(
    const zkaffinity::schema::tag_t tag,
    const uint32_t score,
    const zkaffinity::schema::timestamp_seconds_t timestamp,
    std::string nonce,
    const zkaffinity::schema::address_t& wallet) {
  auto record = zkaffinity::schema::attestation_t{};
  record.tag = tag;
  record.score = score;
  record.timestamp = timestamp;
  record.nonce = std::move(nonce);
  record.publisher = "themodernbyte.com";
  record.subject_wallet = wallet;
  record.signer_address = make_address(0x40);
  record.signature.fill(0x5A);
  record.signature[64] = 27;
  return record;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace zkaffinity::testing
