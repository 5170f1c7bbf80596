#pragma once

#include <zkaffinity/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace zkaffinity::crypto {

struct keypair final {
  zkaffinity::schema::hash32_t private_key{};
  zkaffinity::schema::uncompressed_public_key_t public_key{};
  zkaffinity::schema::address_t address{};
};

using keypair_t = keypair;

/// True when the linked OpenSSL provides the secp256k1 group and the
/// legacy KECCAK-256 digest (OpenSSL 3.2 or newer).
bool available();

/// Ethereum's Keccak-256 (pre-standard 0x01 padding, not SHA3-256).
/// std::nullopt when the digest is unavailable.
std::optional<zkaffinity::schema::hash32_t> keccak256(
    const zkaffinity::schema::bytes_view_t& data);

std::optional<keypair_t> generate_keypair();

/// Derives the public key and address for a raw 32-byte scalar. Returns
/// std::nullopt when the scalar is zero or not below the group order.
std::optional<keypair_t> load_private_key(
    const zkaffinity::schema::hash32_t& private_key);

/// EIP-191 personal message hash:
/// keccak256("\x19Ethereum Signed Message:\n" + len(message) + message).
std::optional<zkaffinity::schema::hash32_t> message_digest(
    std::string_view message);

/// Low-s ECDSA signature laid out as [r || s || v] with v in {27, 28}.
std::optional<zkaffinity::schema::recoverable_signature_t> sign_recoverable(
    const keypair_t& key,
    const zkaffinity::schema::hash32_t& digest);

std::optional<zkaffinity::schema::uncompressed_public_key_t>
recover_public_key(const zkaffinity::schema::hash32_t& digest,
                   const zkaffinity::schema::recoverable_signature_t& signature);

/// Accepts 33-byte compressed or 65-byte uncompressed SEC1 encodings.
std::optional<zkaffinity::schema::uncompressed_public_key_t>
parse_public_key(const zkaffinity::schema::bytes_view_t& encoded);

/// Ethereum address: last 20 bytes of keccak256(x || y).
std::optional<zkaffinity::schema::address_t> address_from_public_key(
    const zkaffinity::schema::uncompressed_public_key_t& public_key);

}  // namespace zkaffinity::crypto
