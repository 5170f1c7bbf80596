#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zkaffinity::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using timestamp_seconds_t = uint64_t;
using attestation_id_t = uint64_t;

// [r || s || v], v in {27, 28}
using recoverable_signature_t = std::array<uint8_t, 65>;
// 0x04 || x || y
using uncompressed_public_key_t = std::array<uint8_t, 65>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Lowercase hex with a `0x` prefix.
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const address_t& address);

/// Accepts an optional `0x`/`0X` prefix; returns std::nullopt on odd length
/// or non-hex characters.
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Requires the `0x` prefix followed by exactly 40 hex characters.
std::optional<address_t> try_make_address(std::string_view hex);
bool is_address(std::string_view hex);

/// Lowercased copy, used for case-insensitive address comparison.
std::string to_lower(std::string_view value);

}  // namespace zkaffinity::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
