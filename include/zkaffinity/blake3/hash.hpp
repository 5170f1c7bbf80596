#pragma once
#include <zkaffinity/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace zkaffinity::blake3 {

/// 32-byte BLAKE3 digest. Used for signer addresses, nonce index keys and
/// proving artifact fingerprints.
zkaffinity::schema::hash32_t hash(const std::string_view& str);
zkaffinity::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace zkaffinity::blake3
