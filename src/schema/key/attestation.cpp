#include <zkaffinity/schema/key/attestation.hpp>
#include <zkaffinity/schema/key/builder.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>

using namespace zkaffinity::schema;

namespace zkaffinity::schema::key {

bytes_t make_attestation_key(const attestation_id_t id) {
  auto b = builder{};
  b.write(kAttestationPrefix);
  b.write(id);
  return b.data;
}

bytes_t make_attestation_prefix() {
  auto b = builder{};
  b.write(kAttestationPrefix);
  return b.data;
}

bytes_t make_nonce_key(const std::string_view nonce) {
  auto b = builder{};
  b.write(kNoncePrefix);
  b.hash(nonce);
  return b.data;
}

bytes_t make_wallet_key(const address_t& wallet, const attestation_id_t id) {
  auto b = builder{};
  b.write(kWalletPrefix);
  b.write(std::span(wallet.data(), wallet.size()));
  b.write("|");
  b.write(id);
  return b.data;
}

bytes_t make_wallet_prefix(const address_t& wallet) {
  auto b = builder{};
  b.write(kWalletPrefix);
  b.write(std::span(wallet.data(), wallet.size()));
  b.write("|");
  return b.data;
}

bytes_t make_tag_key(const tag_t tag, const attestation_id_t id) {
  auto b = builder{};
  b.write(kTagPrefix);
  b.write(tag_id(tag));
  b.write("|");
  b.write(id);
  return b.data;
}

bytes_t make_tag_prefix(const tag_t tag) {
  auto b = builder{};
  b.write(kTagPrefix);
  b.write(tag_id(tag));
  b.write("|");
  return b.data;
}

bytes_t make_next_id_key() {
  auto b = builder{};
  b.write(kNextAttestationIdKey);
  return b.data;
}

std::optional<attestation_id_t> read_trailing_id(const bytes_view_t& key) {
  if (key.size() < sizeof(attestation_id_t)) {
    return std::nullopt;
  }
  auto big = attestation_id_t{};
  std::memcpy(&big, key.data() + key.size() - sizeof(big), sizeof(big));
  return boost::endian::big_to_native(big);
}

}  // namespace zkaffinity::schema::key
