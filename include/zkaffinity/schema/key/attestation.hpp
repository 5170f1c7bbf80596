#pragma once
#include <zkaffinity/schema/attestation.hpp>
#include <zkaffinity/schema/primitives.hpp>

#include <optional>
#include <string_view>

// Key layout for the attestation column space. Ids are written big-endian so
// prefix scans return them in ascending order.
namespace zkaffinity::schema::key {

inline constexpr auto kAttestationPrefix = std::string_view{"ATTESTATION|"};
inline constexpr auto kNoncePrefix = std::string_view{"NONCE|"};
inline constexpr auto kWalletPrefix = std::string_view{"WALLET|"};
inline constexpr auto kTagPrefix = std::string_view{"TAG|"};
inline constexpr auto kNextAttestationIdKey =
    std::string_view{"SYS|ATTESTATION|NEXT_ID"};

bytes_t make_attestation_key(attestation_id_t id);
bytes_t make_attestation_prefix();

bytes_t make_nonce_key(std::string_view nonce);

bytes_t make_wallet_key(const address_t& wallet, attestation_id_t id);
bytes_t make_wallet_prefix(const address_t& wallet);

bytes_t make_tag_key(tag_t tag, attestation_id_t id);
bytes_t make_tag_prefix(tag_t tag);

bytes_t make_next_id_key();

/// Trailing big-endian id of an index or record key.
std::optional<attestation_id_t> read_trailing_id(const bytes_view_t& key);

}  // namespace zkaffinity::schema::key
